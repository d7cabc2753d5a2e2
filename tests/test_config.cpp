#include "test_util.hpp"
#include "config.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace n64core;

namespace {
// getopt wants mutable argv
bool parse(std::vector<std::string> args, Config& cfg, std::string* msg = nullptr){
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    std::ostringstream err;
    const bool failed = parseArgs(int(args.size()), argv.data(), cfg, err);
    if (msg) *msg = err.str();
    return failed;
}
}

int main(){
    TestCtx t;

    {
        Config cfg;
        t.ok(cfg.rdram_mb == 4 && cfg.cycles_per_frame == 1000 && cfg.pipeline_depth == 5, "machine defaults");
        t.ok(cfg.reset_vector == 0xbfc00000u && cfg.boot_vector == 0x80000400u, "vector defaults");
        t.ok(cfg.trace_interval == 500 && cfg.bus_fetch, "trace/fetch defaults");
        t.ok(!parse({"n64core"}, cfg), "no options is fine");
    }

    {
        Config cfg;
        t.ok(!parse({"n64core", "-r", "game.z64", "-f", "3", "-c", "0x10", "-p", "1", "-m", "8", "-D", "-v", "-d"}, cfg),
             "all short options");
        t.ok(cfg.rom_file == "game.z64", "rom");
        t.ok(cfg.frames == 3, "frames");
        t.ok(cfg.cycles_per_frame == 16, "hex cycles");
        t.ok(cfg.pipeline_depth == 1, "depth");
        t.ok(cfg.rdram_mb == 8, "mem");
        t.ok(!cfg.bus_fetch && cfg.verbose && cfg.dump_state, "flags");
    }

    {
        Config cfg;
        t.ok(!parse({"n64core", "--elf", "prog.elf", "--depth", "5"}, cfg), "long options");
        t.ok(cfg.elf_file == "prog.elf" && cfg.pipeline_depth == 5, "long values");
    }

    {
        Config cfg;
        std::string msg;
        t.ok(parse({"n64core", "-p", "0"}, cfg, &msg), "zero depth rejected");
        t.ok(msg.find("-p") != std::string::npos, "message names option");
        t.ok(parse({"n64core", "-c", "abc"}, cfg), "bad number rejected");
        t.ok(parse({"n64core", "-f", "-1"}, cfg), "negative rejected");
        t.ok(parse({"n64core", "-r", "a", "-e", "b"}, cfg), "rom and elf exclusive");
        t.ok(parse({"n64core", "stray"}, cfg), "stray argument");
        t.ok(parse({"n64core", "-f", "99999999999999999999"}, cfg, &msg), "overflowing number rejected");
        t.ok(msg.find("Bad frame count") == 0, "overflow message");
    }

    // help is a request, not an error
    {
        Config cfg;
        std::string msg;
        t.ok(!parse({"n64core", "--help"}, cfg, &msg), "help succeeds");
        t.ok(cfg.help && msg.empty(), "help flagged, nothing reported");
        Config plain;
        t.ok(!plain.help, "help off by default");
    }

    return t.summary("config");
}
