#ifndef N64CORE_ELF_LOADER_HPP
#define N64CORE_ELF_LOADER_HPP

#include <cstdint>
#include <string>

namespace n64core
{
class Rdram;

/// copy the PT_LOAD segments of a 32 bit MIPS ELF into 'mem'
/// Nothing is written unless the whole file checks out.
///@return true on failure (reason in 'err')
bool loadElf(const char *file_name, Rdram &mem, uint32_t &entry, std::string &err);

}

#endif
