#include "system.hpp"
#include "elf_loader.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace n64core
{
constexpr uint32_t System::RDRAM_BASE;
constexpr uint32_t System::RDRAM_KSEG0;

System::System(const Config &cfg)
: cycles_per_frame_(cfg.cycles_per_frame)
, cpu_(cfg)
, rdram_(new Rdram(cfg.rdram_mb))
, bus_(new Bus)
{
	if (cycles_per_frame_ == 0)
		throw std::invalid_argument("a frame needs at least one cycle");

	bus_->addDevice(RDRAM_BASE, rdram_->size(), rdram_);
	bus_->addDevice(RDRAM_KSEG0, rdram_->size(), rdram_);

	if (cfg.bus_fetch)
		fetch_ = bus_.get();
	else
		fetch_ = rdram_.get();
}

void System::reset()
{
	cpu_.reset();
	if (log_)
		log_("[N64] System Reset Complete");
}

void System::stepFrame()
{
	for (uint32_t i = 0; i < cycles_per_frame_; ++i)
		cpu_.step(*fetch_);
}

const RomInfo& System::loadRom(const std::vector<uint8_t> &data)
{
	rom_info_ = rdram_->loadRom(data);
	if (log_)
		log_("[RDRAM/RI] Loaded ROM (" + std::to_string(data.size()) + " bytes)");

	return rom_info_;
}

bool System::loadRomFile(const char *file_name, std::string &err)
{
	std::ifstream ifs(file_name, std::ios::binary);
	if (!ifs)
	{
		err = std::string("Failed to open ") + file_name;
		return true;
	}

	std::vector<uint8_t> data((std::istreambuf_iterator<char>(ifs)),
	    std::istreambuf_iterator<char>());
	if (ifs.bad())
	{
		err = std::string("Failed to read ") + file_name;
		return true;
	}

	loadRom(data);
	return false;
}

bool System::loadElf(const char *file_name, std::string &err)
{
	uint32_t entry = 0;
	if (n64core::loadElf(file_name, *rdram_, entry, err))
		return true;

	cpu_.setBootVector(entry);
	if (log_)
		log_(std::string("[ELF] Loaded ") + file_name);

	return false;
}

void System::setLogger(const Logger &log)
{
	log_ = log;
	cpu_.setLogger(log);
}

}
