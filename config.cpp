#include "config.hpp"
#include <cerrno>
#include <cstdlib>
#include <getopt.h>
#include <ostream>

namespace
{
/// strict unsigned parse (decimal, or hex with 0x)
bool parseNum(const char *s, uint64_t &out)
{
	if (!s || !*s || *s == '-')
		return false;

	char *end = nullptr;
	errno = 0;
	out = strtoull(s, &end, 0);
	return errno != ERANGE && end && *end == '\0';
}

const struct option long_opts[] =
{
	{"rom",     required_argument, nullptr, 'r'},
	{"elf",     required_argument, nullptr, 'e'},
	{"frames",  required_argument, nullptr, 'f'},
	{"cycles",  required_argument, nullptr, 'c'},
	{"depth",   required_argument, nullptr, 'p'},
	{"mem",     required_argument, nullptr, 'm'},
	{"direct",  no_argument,       nullptr, 'D'},
	{"verbose", no_argument,       nullptr, 'v'},
	{"dump",    no_argument,       nullptr, 'd'},
	{"help",    no_argument,       nullptr, 'h'},
	{nullptr,   0,                 nullptr, 0}
};
}

namespace n64core
{
void printUsage(const char *prog, std::ostream &os)
{
	os << "Usage: " << prog
	    << " [-r rom_file | -e elf_file] [-f frames] [-c cycles_per_frame]"
	    << " [-p pipeline_depth] [-m rdram_mb] [-D] [-v] [-d]" << std::endl;
}

bool parseArgs(int argc, char **argv, Config &cfg, std::ostream &err)
{
	const char *optstring = "+r:e:f:c:p:m:Dvdh";
	optind = 0; // full getopt reset, parseArgs may run more than once

	int optc = getopt_long(argc, argv, optstring, long_opts, nullptr);
	while (optc != -1)
	{
		uint64_t n = 0;
		switch (optc)
		{
		case 'r': cfg.rom_file = optarg; break;
		case 'e': cfg.elf_file = optarg; break;
		case 'D': cfg.bus_fetch = false; break;
		case 'v': cfg.verbose = true; break;
		case 'd': cfg.dump_state = true; break;

		case 'f':
			if (!parseNum(optarg, n))
			{
				err << "Bad frame count: " << optarg << std::endl;
				return true;
			}
			cfg.frames = n;
			break;

		case 'c':
		case 'p':
		case 'm':
			if (!parseNum(optarg, n) || n == 0 || n > 0xffffffffull)
			{
				err << "Bad value for -" << char(optc) << ": " << optarg << std::endl;
				return true;
			}
			if (optc == 'c')
				cfg.cycles_per_frame = uint32_t(n);
			else if (optc == 'p')
				cfg.pipeline_depth = uint32_t(n);
			else
				cfg.rdram_mb = uint32_t(n);
			break;

		case 'h':
			cfg.help = true;
			return false;

		default:
			printUsage(argv[0], err);
			return true;
		}

		optc = getopt_long(argc, argv, optstring, long_opts, nullptr);
	}

	if (optind < argc)
	{
		err << "Unexpected argument: " << argv[optind] << std::endl;
		return true;
	}

	if (!cfg.rom_file.empty() && !cfg.elf_file.empty())
	{
		err << "Choose either a ROM or an ELF, not both" << std::endl;
		return true;
	}

	return false;
}

}
