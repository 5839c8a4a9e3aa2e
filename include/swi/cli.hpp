#pragma once

#include <cstdio>

namespace swi {

// swi-locate [-c config] [-v|-q] <specifier>
// Exit codes: 0 resolved (path on `out`), 1 resolution failed, 2 usage or config error.
int RunCli(int argc, char** argv, std::FILE* out = stdout);

} // namespace swi
