#pragma once

#define XGET_VERSION "1.0.0"
#define XGET_USER_AGENT "xget/" XGET_VERSION
