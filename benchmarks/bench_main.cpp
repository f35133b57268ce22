#include "lexlit/literals.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms; size_t literals; size_t borrowed; size_t bytes; };

static RunResult bench_case(const char* name, const lexlit::literal_parser& parser, const std::string &input){
    lexlit::scan_state st(input, lexlit::skip_ascii_ws);
    RunResult r{0.0, 0, 0, input.size()};
    auto t0 = Clock::now();
    for(;;){
        st.skip_ws();
        if(st.eof()) break;
        lexlit::literal_node node;
        if(!parser.parse(st, node)){
            std::cerr << "[bench] case '" << name << "' failed: " << lexlit::describe(st) << "\n";
            return r;
        }
        ++r.literals;
        if(auto *t = lexlit::as_text(node); t && t->borrowed()) ++r.borrowed;
        else if(auto *c = lexlit::as_children(node)){ bool all=true; for(auto &ch: *c) if(auto *ct = lexlit::as_text(ch); !ct || !ct->borrowed()) all=false; if(all) ++r.borrowed; }
    }
    auto t1 = Clock::now();
    r.ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    return r;
}

static std::string repeat(const std::string& unit, size_t n){ std::string s; s.reserve(unit.size()*n); for(size_t i=0;i<n;++i) s+=unit; return s; }

int main(int argc, char** argv){
    size_t n = 20000;
    if(argc>1) n = std::strtoul(argv[1], nullptr, 10);

    auto str = lexlit::string_lit("\"'");
    auto num = lexlit::number_lit();
    auto rep = lexlit::unicode_regexp_replace_lit();

    struct Case { const char* name; const lexlit::literal_parser* parser; std::string input; };
    std::vector<Case> cases;
    cases.push_back({"string_plain", str.get(), repeat("\"the quick brown fox jumps over the lazy dog\" ", n)});
    cases.push_back({"string_escaped", str.get(), repeat("\"the quick\\tbrown fox\\njumps \\u00e9\" ", n)});
    cases.push_back({"string_unicode", str.get(), repeat("\"\xC3\xA9t\xC3\xA9 \xE2\x80\x9C" "caf\xC3\xA9\xE2\x80\x9D\" ", n)});
    cases.push_back({"number_mixed", num.get(), repeat("42 -3.14 1e10 +5 ", n)});
    cases.push_back({"replace_symmetric", rep.get(), repeat("/colou?r/color/ ", n)});
    cases.push_back({"replace_paired", rep.get(), repeat("{a\\}b}(c\\)d) ", n)});

    for(auto &c : cases){
        auto r = bench_case(c.name, *c.parser, c.input);
        double mbps = r.ms > 0 ? (double)r.bytes / (1024.0*1024.0) / (r.ms/1000.0) : 0.0;
        std::cout << c.name << ": " << r.literals << " literals, " << r.borrowed << " borrowed, "
                  << r.ms << " ms, " << mbps << " MiB/s\n";
    }
    return 0;
}
