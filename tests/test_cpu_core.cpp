#include "test_util.hpp"
#include "cpu_core.hpp"
#include "rdram.hpp"
#include <string>
#include <vector>

using namespace n64core;

// records fetch addresses
struct ProbeDevice : public Device {
    uint32_t read32(uint32_t addr) override { reads.push_back(addr); return word; }
    void write32(uint32_t, uint32_t) override {}
    std::vector<uint32_t> reads;
    uint32_t word = 0;
};

int main(){
    TestCtx t;

    // boot transition
    {
        CpuCore cpu;
        ProbeDevice mem;
        t.ok(!cpu.booted() && cpu.cycles() == 0, "starts unbooted");
        t.ok(cpu.regs().getPc() == 0xbfc00000u, "starts at reset vector");

        const uint32_t pc = cpu.step(mem);
        t.ok(cpu.booted(), "booted after first step");
        t.ok(pc == 0x80000404u && cpu.regs().getPc() == 0x80000404u, "jumped to boot vector then advanced");
        t.ok(mem.reads.empty(), "boot step does not touch the bus");
        t.ok(cpu.pipeline().stage(0).valid && cpu.pipeline().stage(0).inst.opcode == 0, "boot step feeds a NOP");

        mem.word = encAddiu(0, 2, 0x0808);
        cpu.step(mem);
        t.ok(mem.reads.size() == 1 && mem.reads[0] == 0x400, "second step fetches pc-4, physical");
        t.ok(cpu.pipeline().stage(0).inst.opcode == Op::ADDIU && cpu.pipeline().stage(0).inst.rs == 2,
             "fetched word decoded into stage 0");
        t.ok(cpu.cycles() == 2 && cpu.instructionsExecuted() == 2, "counters");
        t.ok(!cpu.exceptionPending(), "no exception");
    }

    // sequential fetch addresses
    {
        CpuCore cpu;
        ProbeDevice mem;
        for (int i = 0; i < 4; ++i) cpu.step(mem);
        t.ok(mem.reads.size() == 3 && mem.reads[1] == 0x404 && mem.reads[2] == 0x408, "fetch walks forward");
    }

    // program in RDRAM reaches the register file after the pipeline latency
    {
        CpuCore cpu;
        Rdram mem(1);
        const uint16_t imm = (3 << 11) | 5; // rd = 3
        mem.write32(0x400, encAddiu(0, 0, imm));
        for (int i = 0; i < 6; ++i) cpu.step(mem);
        t.ok(cpu.regs().getReg(3) == 0, "not yet retired");
        cpu.step(mem);
        t.ok(cpu.regs().getReg(3) == imm, "retired on step 7");
    }

    // trace lines
    {
        Config cfg;
        CpuCore cpu(cfg);
        ProbeDevice mem;
        std::vector<std::string> lines;
        cpu.setLogger([&lines](const std::string &s){ lines.push_back(s); });
        for (int i = 0; i < 1000; ++i) cpu.step(mem);
        t.ok(lines.size() == 3, "boot line plus one per 500 cycles");
        t.ok(lines.size() > 0 && lines[0] == "[R4300i] Booted to 0x80000400", "boot line");
        t.ok(lines.size() > 1 && lines[1] == "[R4300i] Cycle 00000500 | PC=0x80000BD0", "trace line");
        t.ok(lines.size() > 2 && lines[2] == "[R4300i] Cycle 00001000 | PC=0x800013A0", "second trace line");

        CpuCore quiet(cfg);
        ProbeDevice mem2;
        for (int i = 0; i < 1000; ++i) quiet.step(mem2);
        t.ok(quiet.regs().getPc() == cpu.regs().getPc() && quiet.cycles() == cpu.cycles(),
             "no logger, same behavior");
    }

    // stall through the core
    {
        CpuCore cpu;
        ProbeDevice mem;
        cpu.step(mem);
        cpu.pipeline().setStall();
        const uint32_t pc = cpu.regs().getPc();
        t.ok(cpu.step(mem) == pc, "stalled step keeps pc");
        t.ok(cpu.cycles() == 2, "stalled step still counts");
    }

    // reset
    {
        CpuCore cpu;
        ProbeDevice mem;
        std::vector<std::string> lines;
        cpu.setLogger([&lines](const std::string &s){ lines.push_back(s); });
        for (int i = 0; i < 10; ++i) cpu.step(mem);
        cpu.regs().setReg(4, 44);
        cpu.reset();
        t.ok(cpu.cycles() == 0 && cpu.instructionsExecuted() == 0, "counters cleared");
        t.ok(cpu.regs().getPc() == 0xbfc00000u, "pc back to reset vector");
        t.ok(cpu.regs().getReg(4) == 0, "registers cleared");
        t.ok(!cpu.booted(), "unbooted");
        t.ok(!cpu.pipeline().stage(0).valid, "pipeline emptied");
        t.ok(!lines.empty() && lines.back() == "[R4300i] CPU Core Reset to PIF Boot", "reset logged");
        cpu.step(mem);
        t.ok(cpu.booted() && cpu.regs().getPc() == 0x80000404u, "boots again");
    }

    // custom vectors and unpipelined core
    {
        Config cfg;
        cfg.reset_vector = 0xa4000040u;
        cfg.boot_vector = 0x80001000u;
        cfg.pipeline_depth = 1;
        CpuCore cpu(cfg);
        Rdram mem(1);
        mem.write32(0x1000, encAddiu(0, 0, (6 << 11) | 1));
        t.ok(cpu.regs().getPc() == 0xa4000040u, "custom reset vector");
        cpu.step(mem);
        t.ok(cpu.regs().getPc() == 0x80001004u, "custom boot vector");
        cpu.step(mem);
        cpu.step(mem);
        t.ok(cpu.regs().getReg(6) == ((6u << 11) | 1), "unpipelined retires next cycle");
    }

    return t.summary("cpu_core");
}
