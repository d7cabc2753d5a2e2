#ifndef N64CORE_SYSTEM_HPP
#define N64CORE_SYSTEM_HPP

#include "bus.hpp"
#include "config.hpp"
#include "cpu_core.hpp"
#include "rdram.hpp"
#include "rom_info.hpp"
#include <memory>
#include <string>
#include <vector>

namespace n64core
{
/// Console model: one CPU core plus RDRAM on a bus
///
/// This is the whole surface a front end needs: load a ROM, reset, and
/// call stepFrame() on a timer.
class System
{
public:
	/// physical window of RDRAM
	static constexpr uint32_t RDRAM_BASE = 0x00000000;
	/// cached (KSEG0) window of RDRAM
	static constexpr uint32_t RDRAM_KSEG0 = 0x80000000;

	explicit System(const Config &cfg = Config());

	void reset();

	/// run one video frame worth of CPU cycles
	void stepFrame();

	/// load an in-memory ROM image
	const RomInfo& loadRom(const std::vector<uint8_t> &data);

	/// read 'file_name' and load it as a ROM
	///@return true on failure (state untouched, reason in 'err')
	bool loadRomFile(const char *file_name, std::string &err);

	/// load a MIPS ELF, its entry becomes the boot vector
	///@return true on failure (state untouched, reason in 'err')
	bool loadElf(const char *file_name, std::string &err);

	/// send core trace lines to 'log'
	void setLogger(const Logger &log);

	const RomInfo& romInfo() const { return rom_info_; }
	uint32_t cyclesPerFrame() const { return cycles_per_frame_; }

	CpuCore& cpu() { return cpu_; }
	const CpuCore& cpu() const { return cpu_; }
	Bus& bus() { return *bus_; }
	Rdram& rdram() { return *rdram_; }
	const Rdram& rdram() const { return *rdram_; }

	/// where instruction fetches go (bus or RDRAM directly)
	Device& fetchPort() { return *fetch_; }

private: // data
	uint32_t cycles_per_frame_;
	CpuCore cpu_;
	std::shared_ptr<Rdram> rdram_; ///< shared with the bus table
	std::unique_ptr<Bus> bus_;
	Device *fetch_ = nullptr;
	RomInfo rom_info_;
	Logger log_;
};

}

#endif
