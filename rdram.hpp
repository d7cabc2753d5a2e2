#ifndef N64CORE_RDRAM_HPP
#define N64CORE_RDRAM_HPP

#include "device.hpp"
#include "rom_info.hpp"
#include <vector>

namespace n64core
{
/// RDRAM backing store, addressed with segment mirroring
class Rdram : public Device
{
public:
	/// strip KSEG bits before wrapping into the store
	static constexpr uint32_t SEGMENT_MASK = 0x1fffffff;

	/// largest store reachable through SEGMENT_MASK
	static constexpr uint32_t MAX_SIZE_MB = 512;

	explicit Rdram(uint32_t size_mb = 4);

	uint32_t size() const { return static_cast<uint32_t>(ram_.size()); }

	/// copy 'data' to offset 0 (wrapping), keep the raw image
	RomInfo loadRom(const std::vector<uint8_t> &data);

	/// most recently loaded image
	const std::vector<uint8_t>& rom() const { return rom_; }

	uint8_t readByte(uint32_t addr) const { return ram_[offset(addr)]; }
	void    writeByte(uint32_t addr, uint8_t val) { ram_[offset(addr)] = val; }

	/// zero the store (the ROM image is kept)
	void clear();

	//---from Device
	/// big endian
	uint32_t read32(uint32_t addr) override;
	void     write32(uint32_t addr, uint32_t val) override;

private: // methods
	uint32_t offset(uint32_t addr) const
	{
		return (addr & SEGMENT_MASK) % size();
	}

private: // data
	std::vector<uint8_t> ram_; ///< backing store
	std::vector<uint8_t> rom_; ///< last ROM image
};

}

#endif
