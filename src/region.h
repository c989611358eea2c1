#ifndef REGION_H_INCLUDED
#define REGION_H_INCLUDED

#include <string>

#include "misc.h"

// selector tags in classifier order
const string_array &getRegionTags();
bool isRegionTag(const std::string &tag);

// every region tag whose patterns hit the name, in table order
string_array matchRegions(const std::string &name);

#endif // REGION_H_INCLUDED
