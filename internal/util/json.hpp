#pragma once

#include <map>
#include <string>

namespace progress::util {

/*
  JSON text encoding of an item's milestone map, as stored by the SQL backends.
*/

std::string                   EncodeMilestoneMap(const std::map<std::string, double>& milestones);
std::map<std::string, double> DecodeMilestoneMap(const std::string& raw);

} // namespace progress::util
