#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "lexlit/diagnostics_json.hpp"
#include "lexlit/env.hpp"
#include "lexlit/literals.hpp"

using namespace lexlit;

static bool read_file(const std::string& path, std::string& out){ std::ifstream ifs(path, std::ios::binary); if(!ifs) return false; std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str(); return true; }

static literal_parser_ptr parser_for(const std::string& kind){
    if(kind == "string") return string_lit("\"'`");
    if(kind == "unicode-string") return unicode_string_lit();
    if(kind == "number") return number_lit();
    if(kind == "regexp-match") return unicode_regexp_match_lit();
    if(kind == "regexp-replace") return unicode_regexp_replace_lit();
    return nullptr;
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: lexlit_driver <string|unicode-string|number|regexp-match|regexp-replace> [file]\n"; return 1; }
    auto parser = parser_for(argv[1]);
    if(!parser){ std::cerr << "unknown literal kind: " << argv[1] << "\n"; return 1; }

    std::string src;
    if(argc>2){ if(!read_file(argv[2], src)){ std::cerr << "failed to read file: " << argv[2] << "\n"; return 1; } }
    else { std::stringstream ss; ss<<std::cin.rdbuf(); src = ss.str(); }

    const LexEnv env = detect_env();
    if(env.maxInput && src.size() > env.maxInput){
        std::cerr << "input of " << src.size() << " bytes exceeds LEXLIT_MAX_INPUT=" << env.maxInput << "\n";
        return 1;
    }

    scan_state st(src, ws_for(env.ws));
    for(;;){
        st.skip_ws();
        if(st.eof()) break;
        literal_node node;
        if(!parser->parse(st, node)){
            std::cerr << parser->name() << ": " << describe(st) << "\n";
            maybe_print_json(st);
            return 2;
        }
        std::cout << to_string(node) << "\n";
    }
    return 0;
}
