#ifndef N64CORE_INST_HPP
#define N64CORE_INST_HPP

#include <cstdint>
#include <string>

namespace n64core
{
/// Primary opcode field values the core knows by name
namespace Op
{
	enum : uint8_t
	{
		SPECIAL = 0x00,
		J       = 0x02,
		JAL     = 0x03,
		BEQ     = 0x04,
		BNE     = 0x05,
		ADDIU   = 0x08, ///< add immediate class; the only one executed
		LUI     = 0x0f,
		LW      = 0x23,
		SW      = 0x2b
	};
}

/// One decoded instruction word
struct Instruction
{
	uint8_t  opcode = 0;
	uint8_t  rs = 0;
	uint8_t  rt = 0;
	uint8_t  rd = 0;
	uint16_t immediate = 0;
	uint32_t target = 0; ///< 26 bit jump target

	/// split 'word' into its fields
	static Instruction decode(uint32_t word);

	/// re-pack the fields (rd and immediate overlap in the encoding)
	uint32_t encode() const;

	///@return assembly string of this
	std::string disasm() const;
};

}

#endif
