/// @file init.cpp
/// One-time initialization barrier for the process-wide tables.

#include <kibitz/init.hpp>

#include <kibitz/attacks.hpp>

#include <mutex>

namespace kibitz {

namespace {
std::once_flag g_init_flag;
}  // namespace

void init() {
    std::call_once(g_init_flag, attacks::init);
}

}  // namespace kibitz
