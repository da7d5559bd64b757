// Copyright (c) 2009 - Mozy, Inc.

#include "string.h"

#include <ctype.h>

#include <algorithm>

namespace Gauge {

std::string
toLower(const std::string &str)
{
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

void
replace(std::string &str, char find, char replaceWith)
{
    std::replace(str.begin(), str.end(), find, replaceWith);
}

}
