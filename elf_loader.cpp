#include "elf_loader.hpp"
#include "rdram.hpp"
#include <elf.h>
#include <fcntl.h>
#include <libelf.h>
#include <unistd.h>
#include <algorithm>
#include <sstream>
#include <vector>

namespace
{
/// closes the handles on every exit path
struct ElfFile
{
	int fd = -1;
	Elf *hnd = nullptr;

	~ElfFile()
	{
		if (hnd)
			elf_end(hnd);
		if (fd >= 0)
			close(fd);
	}
};

struct Segment
{
	uint32_t vaddr;
	uint32_t file_sz;
	uint32_t mem_sz;
	const uint8_t *data;
};
}

namespace n64core
{
bool loadElf(const char *file_name, Rdram &mem, uint32_t &entry, std::string &err)
{
	// check ELF lib
	if (elf_version(EV_CURRENT) == EV_NONE)
	{
		err = "Failed to init libelf";
		return true;
	}

	ElfFile f;
	f.fd = open(file_name, O_RDONLY, 0);
	if (f.fd < 0)
	{
		err = std::string("Failed to open ") + file_name;
		return true;
	}

	f.hnd = elf_begin(f.fd, ELF_C_READ, nullptr);
	if (!f.hnd)
	{
		err = std::string("libelf failed to load ") + file_name + ": " + elf_errmsg(-1);
		return true;
	}

	if (elf_kind(f.hnd) != ELF_K_ELF)
	{
		err = std::string("Not an ELF file: ") + file_name;
		return true;
	}

	// elf32_getehdr fails on 64 bit files
	const Elf32_Ehdr *const eh = elf32_getehdr(f.hnd);
	if (!eh)
	{
		err = "Not a 32 bit ELF";
		return true;
	}
	if (eh->e_machine != EM_MIPS)
	{
		std::ostringstream os;
		os << "Not a MIPS executable (machine " << eh->e_machine << ')';
		err = os.str();
		return true;
	}

	size_t num_headers = 0;
	if (elf_getphdrnum(f.hnd, &num_headers) != 0 || num_headers == 0)
	{
		err = "No program headers";
		return true;
	}

	const Elf32_Phdr *const hdrs = elf32_getphdr(f.hnd); // array of headers
	size_t file_size = 0;
	const uint8_t *const raw = reinterpret_cast<const uint8_t*>(elf_rawfile(f.hnd, &file_size));
	if (!hdrs || !raw)
	{
		err = "Failed to read program headers";
		return true;
	}

	// validate everything before touching memory
	std::vector<Segment> segs;
	for (size_t i = 0; i < num_headers; ++i)
	{
		const Elf32_Phdr &ph = hdrs[i];
		if (ph.p_type != PT_LOAD)
			continue;

		if (uint64_t(ph.p_offset) + ph.p_filesz > file_size)
		{
			std::ostringstream os;
			os << "Segment " << i << " runs past the end of the file";
			err = os.str();
			return true;
		}
		if (std::max(ph.p_filesz, ph.p_memsz) > mem.size())
		{
			std::ostringstream os;
			os << "Segment " << i << " is larger than RDRAM";
			err = os.str();
			return true;
		}

		segs.push_back(Segment{ph.p_vaddr, ph.p_filesz, ph.p_memsz, raw + ph.p_offset});
	}

	if (segs.empty())
	{
		err = "No loadable segments";
		return true;
	}

	for (const auto &s : segs)
	{
		const uint32_t tgt_sz = s.mem_sz > s.file_sz ? s.mem_sz : s.file_sz;
		for (uint32_t i = 0; i < tgt_sz; ++i)
			mem.writeByte(s.vaddr + i, i < s.file_sz ? s.data[i] : 0);
	}

	entry = eh->e_entry;
	return false; // no errors
}

}
