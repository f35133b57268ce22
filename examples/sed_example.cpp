// sed-style substitution commands: a PEGTL grammar with lexlit replace literals as leaves.
#include <iostream>
#include <string>
#include <vector>
#include "lexlit/pegtl.hpp"
#include "lexlit/state.hpp"

namespace pegtl = tao::pegtl;

struct subst_flags : pegtl::star< pegtl::one<'g','i','m'> > {};
struct subst : pegtl::seq< pegtl::one<'s'>, lexlit::pegtl::regexp_replace_rule, subst_flags > {};
struct separator : pegtl::pad< pegtl::one<';'>, pegtl::space > {};
struct script : pegtl::must< pegtl::star< pegtl::space >, pegtl::list< subst, separator >, pegtl::star< pegtl::space >, pegtl::eof > {};

template<typename Rule> struct action : pegtl::nothing<Rule> {};
template<> struct action<subst_flags> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, std::vector<lexlit::literal_node>&, lexlit::scan_error&, std::vector<std::string>& flags){ flags.push_back(in.string()); }
};

int main(){
    const std::string src = R"SED(s/colou?r/color/g; s{été}(summer); s#a\#b#\t#)SED";
    std::vector<lexlit::literal_node> substs;
    lexlit::scan_error furthest;
    std::vector<std::string> flags;
    try {
        pegtl::memory_input in(src, "sed-example");
        pegtl::parse< script, action >(in, substs, furthest, flags);
    } catch(const pegtl::parse_error& e){
        std::cerr << e.what() << "\n";
        if(furthest.set) std::cerr << "furthest literal error: expected " << furthest.expected << " at byte " << furthest.pos << "\n";
        return 1;
    }
    for(size_t i=0;i<substs.size(); ++i){
        std::cout << lexlit::to_string(substs[i]) << " flags=" << (i<flags.size() ? flags[i] : std::string()) << "\n";
    }
    std::cout << "sed example OK\n";
    return 0;
}
