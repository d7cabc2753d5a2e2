#include "inst.hpp"
#include <iomanip>
#include <sstream>

namespace
{
	// 8 character mnemonics
	constexpr uint32_t MNE_WIDTH = 8;

	std::ostream& printReg(std::ostream &os, uint8_t r)
	{
		return os << 'r' << uint32_t(r);
	}

	std::ostream& printHex(std::ostream &os, uint32_t v, int width)
	{
		return os << "0x" << std::right << std::hex << std::setw(width) << std::setfill('0') << v
		    << std::dec << std::setfill(' ');
	}
}

namespace n64core
{
Instruction Instruction::decode(uint32_t word)
{
	Instruction i;
	i.opcode    = (word >> 26) & 0x3f;
	i.rs        = (word >> 21) & 0x1f;
	i.rt        = (word >> 16) & 0x1f;
	i.rd        = (word >> 11) & 0x1f;
	i.immediate = word & 0xffff;
	i.target    = word & 0x3ffffff;
	return i;
}

uint32_t Instruction::encode() const
{
	if (opcode == Op::J || opcode == Op::JAL)
		return (uint32_t(opcode) << 26) | (target & 0x3ffffff);

	return (uint32_t(opcode) << 26)
	    | (uint32_t(rs) << 21)
	    | (uint32_t(rt) << 16)
	    | immediate;
}

std::string Instruction::disasm() const
{
	std::ostringstream os;
	os << std::left;
	switch (opcode)
	{
	case Op::SPECIAL:
		if (immediate == 0 && rs == 0 && rt == 0)
		{
			os << "NOP";
			break;
		}
		os << std::setw(MNE_WIDTH) << "SPECIAL";
		printReg(os, rd) << ", ";
		printReg(os, rs) << ", ";
		printReg(os, rt);
		break;

	case Op::J:
	case Op::JAL:
		os << std::setw(MNE_WIDTH) << (opcode == Op::J ? "J" : "JAL");
		printHex(os, target << 2, 8);
		break;

	case Op::ADDIU:
		// the core writes the result to rd
		os << std::setw(MNE_WIDTH) << "ADDIU";
		printReg(os, rd) << ", ";
		printReg(os, rs) << ", ";
		printHex(os, immediate, 4);
		break;

	case Op::LUI:
		os << std::setw(MNE_WIDTH) << "LUI";
		printReg(os, rt) << ", ";
		printHex(os, immediate, 4);
		break;

	case Op::BEQ:
	case Op::BNE:
	case Op::LW:
	case Op::SW:
	{
		const char *mne = opcode == Op::BEQ ? "BEQ" :
		                  opcode == Op::BNE ? "BNE" :
		                  opcode == Op::LW  ? "LW"  : "SW";
		os << std::setw(MNE_WIDTH) << mne;
		printReg(os, rt) << ", ";
		printReg(os, rs) << ", ";
		printHex(os, immediate, 4);
		break;
	}

	default:
		os << std::setw(MNE_WIDTH) << "OP";
		printHex(os, opcode, 2);
		break;
	}
	return os.str();
}

}
