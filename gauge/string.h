#ifndef __GAUGE_STRING_H__
#define __GAUGE_STRING_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>

namespace Gauge {

std::string toLower(const std::string &str);

void replace(std::string &str, char find, char replaceWith);

}

#endif
