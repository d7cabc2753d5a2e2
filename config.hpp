#ifndef N64CORE_CONFIG_HPP
#define N64CORE_CONFIG_HPP

#include <cstdint>
#include <iosfwd>
#include <string>

namespace n64core
{
/// Machine and driver settings
struct Config
{
	//---machine
	uint32_t rdram_mb = 4;
	uint32_t cycles_per_frame = 1000;
	uint32_t pipeline_depth = 5;       ///< 1 runs unpipelined
	uint32_t reset_vector = 0xbfc00000;
	uint32_t boot_vector = 0x80000400; ///< PC after the boot step
	uint32_t trace_interval = 500;     ///< cycles between trace lines, 0 disables
	bool bus_fetch = true;             ///< false fetches straight from RDRAM

	//---driver
	std::string rom_file;
	std::string elf_file;
	uint64_t frames = 60;
	bool verbose = false;
	bool dump_state = false;
	bool help = false; ///< usage requested, nothing to run
};

/// fill 'cfg' from the command line
///@return true on failure (message written to 'err')
bool parseArgs(int argc, char **argv, Config &cfg, std::ostream &err);

void printUsage(const char *prog, std::ostream &os);

}

#endif
