#ifndef N64CORE_ROM_INFO_HPP
#define N64CORE_ROM_INFO_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace n64core
{
/// Descriptive record pulled from a cartridge header (pass-through only)
struct RomInfo
{
	/// byte order of the image, from its first word
	enum class Format
	{
		UNKNOWN,
		Z64, ///< big endian (native)
		V64, ///< byte swapped
		N64  ///< little endian
	};

	std::string name = "No ROM";
	std::string region = "NTSC";
	std::string version = "1.0";
	std::string crc1 = "00000000";
	std::string crc2 = "00000000";
	std::string cic = "6102";
	Format format = Format::UNKNOWN;
	size_t size = 0;

	/// build a descriptor for 'data'; never fails
	static RomInfo parse(const std::vector<uint8_t> &data);

	static Format detectFormat(const std::vector<uint8_t> &data);
};

const char* formatName(RomInfo::Format f);

}

#endif
