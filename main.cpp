#include "config.hpp"
#include "system.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>

using namespace n64core;

namespace
{
/// built in image used when no program is given
std::vector<uint8_t> testRom()
{
	std::vector<uint8_t> rom = {0x37, 0x82, 0x00, 0x08};
	rom.resize(rom.size() + 100, 0);
	return rom;
}

void printRomInfo(const RomInfo &info)
{
	std::cout << "ROM:     " << info.name << std::endl
	    << "Country: " << info.region << std::endl
	    << "Version: " << info.version << std::endl
	    << "CRC1:    " << info.crc1 << std::endl
	    << "CRC2:    " << info.crc2 << std::endl
	    << "CIC:     " << info.cic << std::endl
	    << "Format:  " << formatName(info.format)
	    << " (" << info.size << " bytes)" << std::endl;
}
}

int main(int argc, char **argv)
{
	Config cfg;
	if (parseArgs(argc, argv, cfg, std::cerr))
		return 1;

	if (cfg.help)
	{
		printUsage(argv[0], std::cout);
		return 0;
	}

	std::unique_ptr<System> sys;
	try
	{
		sys.reset(new System(cfg));
	}
	catch (const std::invalid_argument &e)
	{
		std::cerr << "Bad configuration: " << e.what() << std::endl;
		return 1;
	}

	if (cfg.verbose)
	{
		sys->setLogger([](const std::string &s)
		{
			std::cout << s << std::endl;
		});
	}

	std::string err;
	if (!cfg.elf_file.empty())
	{
		if (sys->loadElf(cfg.elf_file.c_str(), err))
		{
			std::cerr << "Failure loading ELF: " << err << std::endl;
			return 1;
		}
	}
	else if (!cfg.rom_file.empty())
	{
		if (sys->loadRomFile(cfg.rom_file.c_str(), err))
		{
			std::cerr << "Failure loading ROM: " << err << std::endl;
			return 1;
		}
		printRomInfo(sys->romInfo());
	}
	else
	{
		std::cout << "No program given, using the test ROM." << std::endl;
		sys->loadRom(testRom());
		printRomInfo(sys->romInfo());
	}

	sys->reset();

	std::cout << "Run " << cfg.frames << " frames of "
	    << sys->cyclesPerFrame() << " cycles ("
	    << sys->cpu().pipeline().depth() << " stage pipeline, "
	    << (cfg.bus_fetch ? "bus" : "direct") << " fetch)." << std::endl;

	for (uint64_t f = 0; f < cfg.frames; ++f)
		sys->stepFrame();

	const CpuCore &cpu = sys->cpu();

	// dump architected state
	if (cfg.dump_state)
	{
		const RegisterFile &regs = cpu.regs();
		std::cout << std::endl << "Architected State" << std::endl;
		for (uint32_t i = 0; i < RegisterFile::NUM_REGS;)
		{
			for (uint32_t j = 0; j < 4; ++j, ++i)
			{
				std::cout << std::setw(2) << i << ' '
				    << std::hex << std::setw(8) << std::setfill('0') << regs.getReg(i)
				    << std::setfill(' ') << std::dec << ' ';
			}
			std::cout << std::endl;
		}
		std::cout << "PC " << std::hex << regs.getPc()
		    << " HI " << regs.getHi()
		    << " LO " << regs.getLo() << std::dec << std::endl;

		std::cout << "Pipeline" << std::endl;
		for (uint32_t i = 0; i < cpu.pipeline().depth(); ++i)
		{
			const Pipeline::Stage &s = cpu.pipeline().stage(i);
			std::cout << ' ' << i << ' '
			    << std::left << std::setw(24) << (s.valid ? s.inst.disasm() : "-")
			    << std::right << std::hex << s.value << std::dec << std::endl;
		}
	}

	std::cout << "Executed " << cpu.instructionsExecuted() << " instructions in "
	    << cpu.cycles() << " cycles." << std::endl;

	return 0;
}
