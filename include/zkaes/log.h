// log.h
#pragma once
#include <string>

namespace zkaes {

void setDebug(bool on);
bool debugEnabled();

// Writes "[DBG] <s>" to stderr when debugging is on.
void dbg(const std::string& s);

} // namespace zkaes
