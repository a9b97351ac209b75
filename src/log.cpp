// log.cpp
#include "zkaes/log.h"

#include <cstdio>

namespace zkaes {

static bool g_debug = false;

void setDebug(bool on){ g_debug = on; }
bool debugEnabled(){ return g_debug; }

void dbg(const std::string& s){ if(g_debug) fprintf(stderr, "[DBG] %s\n", s.c_str()); }

} // namespace zkaes
