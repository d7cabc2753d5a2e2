#include "rom_info.hpp"
#include <iomanip>
#include <utility>
#include <sstream>

namespace
{
constexpr size_t HEADER_SIZE = 0x40;
constexpr size_t NAME_OFFSET = 0x20;
constexpr size_t NAME_SIZE   = 0x14;
constexpr size_t CRC1_OFFSET = 0x10;
constexpr size_t CRC2_OFFSET = 0x14;
constexpr size_t COUNTRY_OFFSET = 0x3e;
constexpr size_t VERSION_OFFSET = 0x3f;

uint32_t firstWord(const std::vector<uint8_t> &data)
{
	uint32_t w = 0;
	for (size_t i = 0; i < 4; ++i)
		w = (w << 8) | (i < data.size() ? data[i] : 0);
	return w;
}

/// header bytes in big endian order
std::vector<uint8_t> normalizeHeader(const std::vector<uint8_t> &data, n64core::RomInfo::Format f)
{
	std::vector<uint8_t> hdr(data.begin(), data.begin() + HEADER_SIZE);
	if (f == n64core::RomInfo::Format::V64)
	{
		for (size_t i = 0; i + 1 < hdr.size(); i += 2)
			std::swap(hdr[i], hdr[i + 1]);
	}
	else if (f == n64core::RomInfo::Format::N64)
	{
		for (size_t i = 0; i + 3 < hdr.size(); i += 4)
		{
			std::swap(hdr[i], hdr[i + 3]);
			std::swap(hdr[i + 1], hdr[i + 2]);
		}
	}
	return hdr;
}

std::string hexWord(const std::vector<uint8_t> &hdr, size_t ofs)
{
	uint32_t w = 0;
	for (size_t i = 0; i < 4; ++i)
		w = (w << 8) | hdr[ofs + i];

	std::ostringstream os;
	os << std::hex << std::uppercase << std::setw(8) << std::setfill('0') << w;
	return os.str();
}

const char* regionName(uint8_t country)
{
	switch (country)
	{
	case 'E': return "USA";
	case 'N': return "NTSC";
	case 'J': return "Japan";
	case 'P': return "PAL";
	case 'D': return "Germany";
	case 'F': return "France";
	case 'I': return "Italy";
	case 'S': return "Spain";
	case 'U': return "Australia";
	case 'X':
	case 'Y': return "PAL";
	}
	return "NTSC";
}
}

namespace n64core
{
RomInfo::Format RomInfo::detectFormat(const std::vector<uint8_t> &data)
{
	switch (firstWord(data))
	{
	case 0x80371240: return Format::Z64;
	case 0x37804012: return Format::V64;
	case 0x40123780: return Format::N64;
	}
	return Format::UNKNOWN;
}

RomInfo RomInfo::parse(const std::vector<uint8_t> &data)
{
	RomInfo info;
	info.size = data.size();
	info.format = detectFormat(data);

	if (data.size() < HEADER_SIZE)
	{
		info.name = "Invalid ROM";
		return info;
	}

	const std::vector<uint8_t> hdr = normalizeHeader(data, info.format);

	std::string name;
	for (size_t i = NAME_OFFSET; i < NAME_OFFSET + NAME_SIZE; ++i)
	{
		const uint8_t c = hdr[i];
		if (c != 0 && c < 0x80) // ascii only
			name += char(c);
	}
	const size_t end = name.find_last_not_of(' ');
	name.erase(end == std::string::npos ? 0 : end + 1);
	info.name = name.empty() ? "Demo ROM" : name;

	info.crc1 = hexWord(hdr, CRC1_OFFSET);
	info.crc2 = hexWord(hdr, CRC2_OFFSET);
	info.region = regionName(hdr[COUNTRY_OFFSET]);
	info.version = "1." + std::to_string(uint32_t(hdr[VERSION_OFFSET]));

	return info;
}

const char* formatName(RomInfo::Format f)
{
	switch (f)
	{
	case RomInfo::Format::Z64: return "z64";
	case RomInfo::Format::V64: return "v64";
	case RomInfo::Format::N64: return "n64";
	case RomInfo::Format::UNKNOWN: break;
	}
	return "unknown";
}

}
