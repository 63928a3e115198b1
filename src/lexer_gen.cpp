// Generates the Jack lexer tables; an alternative to 'lex' and 'flex'.
//
// Usage: jackc_lexer_gen [output directory]
// Writes lex_tables.hpp and lex_tables.cpp, which hold a minimized DFA
// encoded as an equivalence-class table and a transition table.

#include <ctype.h>
#include <cctype>
#include <algorithm>
#include <array>
#include <cassert>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>

namespace bc = boost::container;
namespace fs = std::filesystem;

constexpr unsigned ACCEPT = 256;
constexpr unsigned EMPTY = 257;
constexpr unsigned CONCAT = 258;
constexpr unsigned UNION = 259;
constexpr unsigned KLEENE = 260;

struct regex_t
{
    unsigned type;
    std::unique_ptr<regex_t> l;
    std::unique_ptr<regex_t> r;
    char const* name = nullptr;
    char const* string = nullptr;
};

struct nfa_edge_t { unsigned chr; struct nfa_node_t* ptr; };

struct nfa_node_t
{
    std::vector<nfa_edge_t> edges;
    char const* name = nullptr;
    char const* string = nullptr;
    unsigned prio = 0;
};

struct nfa_t
{
    nfa_node_t* first;
    nfa_node_t* last;
};

using rptr = std::unique_ptr<regex_t>;

rptr clone(rptr const& a)
{
    if(!a)
        return nullptr;
    return rptr(new regex_t{ a->type, clone(a->l), clone(a->r), a->name, a->string });
}

// Matches any single character satisfying 'f'.
template<typename F>
rptr pred(F f)
{
    rptr base;
    unsigned char c = 0;
    do
    {
        if(f(c))
        {
            if(!base)
                base.reset(new regex_t{c});
            else
                base.reset(new regex_t{ UNION, rptr(new regex_t{c}), std::move(base) });
        }
        ++c;
    }
    while(c != 0);
    return base;
}

rptr word(std::string word)
{
    rptr base;
    while(word.size())
    {
        unsigned c = static_cast<unsigned char>(word.back());
        if(!base)
            base.reset(new regex_t{c});
        else
            base.reset(new regex_t{ CONCAT, rptr(new regex_t{c}), std::move(base) });
        word.pop_back();
    }
    return base;
}

template<typename... T>
rptr cat(rptr a, rptr b, rptr c, T... t)
    { return rptr(new regex_t{ CONCAT, std::move(a), cat(std::move(b), std::move(c), std::move(t)...) }); }
rptr cat(rptr a, rptr b)
    { return rptr(new regex_t{ CONCAT, std::move(a), std::move(b) }); }
template<typename... T>
rptr uor(rptr a, rptr b, rptr c, T... t)
    { return rptr(new regex_t{ UNION, std::move(a), uor(std::move(b), std::move(c), std::move(t)...) }); }
rptr uor(rptr a, rptr b)
    { return rptr(new regex_t{ UNION, std::move(a), std::move(b) }); }
rptr accept(char const* name, char const* str, rptr a)
    { return cat(std::move(a), rptr(new regex_t{ ACCEPT, nullptr, nullptr, name, str })); }
rptr kleene(rptr a)
    { return rptr(new regex_t{ KLEENE, std::move(a), nullptr }); }
rptr keyword(char const* str)
    { return accept(str, str, word(str)); }
rptr symbol(char const* name, char const* str)
    { return accept(name, str, word(str)); }
rptr many1(rptr r)
    { return cat(clone(r), kleene(clone(r))); }

// Earlier accepts get lower priorities, and lower priorities win ties.
nfa_t gen_nfa(regex_t const& regex,
              std::deque<nfa_node_t>& nodes,
              nfa_node_t* start = nullptr)
{
    static unsigned prio = 0;
    switch(regex.type)
    {
    default:
    case ACCEPT:
    case EMPTY:
        {
            nfa_t nfa;
            nfa.first = start ? start : &nodes.emplace_back();
            nfa.last  = &nodes.emplace_back();
            nfa.first->edges.push_back({ regex.type, nfa.last });
            nfa.last->name = regex.name;
            nfa.last->string = regex.string;
            if(regex.type == ACCEPT)
                nfa.last->prio = prio++;
            return nfa;
        }
    case CONCAT:
        {
            nfa_t l = gen_nfa(*regex.l, nodes, start);
            nfa_t r = gen_nfa(*regex.r, nodes, l.last);
            return { l.first, r.last };
        }
    case UNION:
        {
            nfa_t l = gen_nfa(*regex.l, nodes);
            nfa_t r = gen_nfa(*regex.r, nodes);
            nfa_t nfa;
            nfa.first = start ? start : &nodes.emplace_back();
            nfa.last  = &nodes.emplace_back();
            nfa.first->edges.push_back({ EMPTY, l.first });
            nfa.first->edges.push_back({ EMPTY, r.first });
            l.last->edges.push_back({ EMPTY, nfa.last });
            r.last->edges.push_back({ EMPTY, nfa.last });
            return nfa;
        }
    case KLEENE:
        {
            nfa_t nfa = gen_nfa(*regex.l, nodes);
            nfa_node_t* old_first = nfa.first;
            nfa_node_t* old_last = nfa.last;
            nfa.first = start ? start : &nodes.emplace_back();
            nfa.last  = &nodes.emplace_back();
            nfa.first->edges.push_back({ EMPTY, old_first });
            nfa.first->edges.push_back({ EMPTY, nfa.last });
            old_last->edges.push_back({ EMPTY, old_first });
            old_last->edges.push_back({ EMPTY, nfa.last });
            return nfa;
        }
    }
}

using nfa_set_t = bc::flat_set<nfa_node_t*>;
using dfa_node_t = std::pair<nfa_set_t const, struct dfa_edges_t>;
using dfa_set_t = bc::flat_set<dfa_node_t*>;
struct dfa_edges_t
{
    bc::flat_map<unsigned, dfa_node_t*> map;
    dfa_set_t const* dfa_set = nullptr;
};

struct dfa_t
{
    dfa_node_t* first;
    std::map<nfa_set_t, dfa_edges_t> nodes;
};

template<typename Set>
typename Set::value_type pop_back(Set& set)
{
    auto it = std::prev(set.end());
    typename Set::value_type ret = *it;
    set.erase(it);
    return ret;
}

nfa_set_t gen_eclosure(nfa_set_t todo)
{
    nfa_set_t ret(todo);
    while(todo.size())
    {
        nfa_node_t* n = pop_back(todo);
        for(nfa_edge_t e : n->edges)
            if(e.chr == EMPTY && ret.insert(e.ptr).second)
                todo.insert(e.ptr);
    }
    return ret;
}

dfa_t nfa_to_dfa(nfa_t const& nfa)
{
    dfa_t dfa;
    dfa.nodes[gen_eclosure(nfa_set_t{ nfa.first })];
    dfa.first = &*dfa.nodes.begin();
    dfa_set_t todo = { dfa.first };

    bc::flat_map<std::pair<unsigned, unsigned>, nfa_set_t> edges;
    while(todo.size())
    {
        dfa_node_t* node = pop_back(todo);

        edges.clear();
        for(nfa_node_t* np : node->first)
            for(nfa_edge_t edge : np->edges)
                if(edge.chr <= ACCEPT)
                    edges[std::make_pair(edge.chr, edge.ptr->prio)].insert(edge.ptr);

        for(auto const& edge : edges)
        {
            auto p = dfa.nodes.emplace(gen_eclosure(edge.second), dfa_edges_t());
            if(p.second)
                todo.insert(&*p.first);
            node->second.map.emplace(edge.first.first, &*p.first);
        }
    }
    return dfa;
}

// Partition refinement: splits sets of DFA nodes until every node in a set
// transitions into the same sets.
bc::flat_set<dfa_set_t> minimize_dfa(dfa_t& dfa)
{
    bc::flat_set<dfa_set_t> P;
    dfa_set_t not_final;
    for(auto& p : dfa.nodes)
        if(p.second.map.empty())
            P.insert(dfa_set_t{ &p });
        else
            not_final.insert(&p);
    P.insert(std::move(not_final));

    bc::flat_set<dfa_set_t> P2;
    bc::flat_set<unsigned> letters;
    bc::flat_map<dfa_set_t const*, dfa_set_t> C;
    while(true)
    {
        for(dfa_set_t const& s : P)
            for(dfa_node_t* np : s)
                np->second.dfa_set = &s;

        for(dfa_set_t const& s : P)
        {
            if(s.size() == 1)
            {
                P2.insert(s);
                continue;
            }

            letters.clear();
            for(dfa_node_t const* np : s)
                for(auto const& pair : np->second.map)
                    if(pair.first < 256)
                        letters.emplace(pair.first);

            if(letters.empty())
            {
                C.clear();
                for(dfa_node_t* np : s)
                {
                    auto it = np->second.map.find(ACCEPT);
                    if(it != np->second.map.end())
                        C[it->second->second.dfa_set].insert(np);
                    else
                        C[nullptr].insert(np);
                }
                for(auto& pair : C)
                    P2.insert(std::move(pair.second));
            }
            else
            {
                bool split = false;
                for(unsigned l : letters)
                {
                    C.clear();
                    for(dfa_node_t* np : s)
                    {
                        auto& map = np->second.map;
                        auto it = map.find(l);
                        if(it == map.end())
                            it = map.find(ACCEPT);
                        if(it == map.end())
                            C[nullptr].insert(np);
                        else
                            C[it->second->second.dfa_set].insert(np);
                    }
                    if(C.size() > 1)
                    {
                        for(auto& pair : C)
                            P2.insert(std::move(pair.second));
                        split = true;
                        break;
                    }
                }
                if(!split)
                    P2.insert(s);
            }
        }
        if(P == P2)
            return P;
        P = std::move(P2);
        P2.clear();
    }
}

void print_output(dfa_t const& dfa, bc::flat_set<dfa_set_t> const& mini,
                  fs::path const& dir, char const* name_space)
{
    fs::path const hpp_path = dir / (std::string(name_space) + "_tables.hpp");
    fs::path const cpp_path = dir / (std::string(name_space) + "_tables.cpp");

    std::FILE* hpp = std::fopen(hpp_path.string().c_str(), "w");
    std::FILE* cpp = std::fopen(cpp_path.string().c_str(), "w");

    if(!hpp || !cpp)
    {
        std::fprintf(stderr, "Unable to write lexer tables into %s\n", dir.string().c_str());
        std::exit(EXIT_FAILURE);
    }

    std::unordered_map<dfa_set_t const*, unsigned> nodes;
    std::vector<dfa_set_t const*> node_vector;
    std::fprintf(hpp, "// Generated by jackc_lexer_gen.\n");
    std::fprintf(hpp, "#ifndef %s_TABLES_HPP\n#define %s_TABLES_HPP\n", name_space, name_space);
    std::fprintf(hpp, "#include <cstdint>\n");
    std::fprintf(hpp, "#include <string_view>\n");
    std::fprintf(hpp, "namespace %s\n{\n", name_space);
    std::fprintf(hpp, "using token_type_t = std::uint16_t;\n");
    std::fprintf(hpp, "constexpr token_type_t TOK_ERROR = 0;\n");
    nodes.emplace(nullptr, nodes.size()); // Reserve for TOK_ERROR.
    node_vector.push_back(nullptr);

    // Accepting states are the sets holding a single node with no edges.
    bc::flat_map<unsigned, std::pair<dfa_set_t const*, nfa_node_t const*>> names;
    for(dfa_set_t const& s : mini)
    {
        if(s.size() != 1)
            continue;
        dfa_edges_t const& e = (*s.begin())->second;
        if(e.map.size())
            continue;
        for(nfa_node_t const* np : (*s.begin())->first)
            if(np->name)
                names.emplace(np->prio, std::make_pair(&s, np));
    }

    for(auto const& p : names)
    {
        std::fprintf(hpp, "constexpr token_type_t TOK_%s = %u;\n",
                     p.second.second->name, (unsigned)node_vector.size());
        nodes.emplace(p.second.first, nodes.size());
        node_vector.push_back(p.second.first);
    }
    std::fprintf(hpp, "constexpr token_type_t TOK_END = %u;\n", (unsigned)node_vector.size());

    std::fprintf(hpp, "inline std::string_view token_name(token_type_t type)\n{\n");
    std::fprintf(hpp, "    using namespace std::literals;\n");
    std::fprintf(hpp, "    switch(type)\n    {\n");
    std::fprintf(hpp, "    default: return \"?BAD?\"sv;\n");
    for(auto const& p : names)
        std::fprintf(hpp, "    case TOK_%s: return \"%s\"sv;\n",
                    p.second.second->name, p.second.second->name);
    std::fprintf(hpp, "    }\n}\n");

    std::fprintf(hpp, "inline std::string_view token_string(token_type_t type)\n{\n");
    std::fprintf(hpp, "    using namespace std::literals;\n");
    std::fprintf(hpp, "    switch(type)\n    {\n");
    std::fprintf(hpp, "    default: return \"?BAD?\"sv;\n");
    for(auto const& p : names)
        std::fprintf(hpp, "    case TOK_%s: return \"%s\"sv;\n",
                    p.second.second->name, p.second.second->string);
    std::fprintf(hpp, "    }\n}\n");

    std::fprintf(hpp, "constexpr token_type_t TOK_LAST_STATE = %u;\n",
                (unsigned)nodes.size() - 1);

    for(dfa_set_t const& s : mini)
        if(nodes.emplace(&s, nodes.size()).second)
            node_vector.push_back(&s);

    for(dfa_set_t const& s : mini)
    {
        if(s.count(dfa.first))
        {
            std::fprintf(hpp, "constexpr token_type_t TOK_START = %u;\n", nodes[&s]);
            break;
        }
    }

    // Group characters into equivalence classes: two characters share a
    // class when every state treats them the same.
    bc::flat_map<dfa_set_t const*, bc::flat_set<unsigned>> outgoing;
    bc::flat_set<bc::flat_set<unsigned>> char_sets;
    bc::flat_set<bc::flat_set<unsigned>> char_ec;
    bc::flat_set<bc::flat_set<unsigned>> char_ec_swap;
    for(dfa_set_t const& s : mini)
    {
        outgoing.clear();
        bc::flat_set<unsigned> total;
        bc::flat_set<unsigned> complement;
        for(dfa_node_t const* np : s)
        {
            for(auto pair : np->second.map)
            {
                if(pair.first < 256)
                {
                    outgoing[pair.second->second.dfa_set].insert(pair.first);
                    total.insert(pair.first);
                }
            }
        }
        for(auto& pair : outgoing)
            char_sets.insert(std::move(pair.second));
        for(unsigned i = 0 ; i != 256; ++i)
            if(total.count(i) == 0)
                complement.insert(i);
        char_sets.insert(std::move(complement));
    }

    for(bc::flat_set<unsigned> cs : char_sets)
    {
        char_ec_swap.clear();
        for(auto const& ec : char_ec)
        {
            bc::flat_set<unsigned> intersect;
            bc::flat_set<unsigned> difference;
            bc::flat_set<unsigned> remainder;
            std::set_intersection(cs.begin(), cs.end(), ec.begin(), ec.end(),
                                  std::inserter(intersect, intersect.end()));
            std::set_difference(ec.begin(), ec.end(), intersect.begin(), intersect.end(),
                                std::inserter(remainder, remainder.end()));
            std::set_difference(cs.begin(), cs.end(), ec.begin(), ec.end(),
                                std::inserter(difference, difference.end()));
            cs = std::move(difference);
            if(remainder.size())
                char_ec_swap.insert(std::move(remainder));
            if(intersect.size())
                char_ec_swap.insert(std::move(intersect));
        }
        if(cs.size())
            char_ec_swap.insert(std::move(cs));
        char_ec = std::move(char_ec_swap);
        char_ec_swap.clear();
    }

    std::array<unsigned, 256> ec_table = {};
    for(unsigned i = 0 ; i != 256; ++i)
    for(unsigned j = 0; j < char_ec.size(); ++j)
    {
        if(char_ec.nth(j)->count(i))
        {
            ec_table[i] = j * node_vector.size();
            break;
        }
    }

    std::fprintf(cpp, "// Generated by jackc_lexer_gen.\n");
    std::fprintf(cpp, "#include \"%s_tables.hpp\"\n", name_space);
    std::fprintf(cpp, "namespace %s\n{\n", name_space);
    std::fprintf(cpp, "extern unsigned const lexer_ec_table[256] = {");
    for(unsigned i = 0 ; i != 256; ++i)
        std::fprintf(cpp, "%s%u,", i % 16 == 0 ? "\n    " : " ", ec_table[i]);
    std::fprintf(cpp, "\n};\n");

    std::vector<unsigned> ttable(char_ec.size() * node_vector.size(), 0);
    for(unsigned i = 0; i < char_ec.size(); ++i)
    {
        unsigned const c = *char_ec.nth(i)->begin();
        for(unsigned j = 0; j < node_vector.size(); ++j)
        {
            if(node_vector[j] == nullptr)
                continue;

            unsigned& entry = ttable[i*node_vector.size()+j];

            for(dfa_node_t const* np : *node_vector[j])
            {
                auto it = np->second.map.find(c);
                if(it != np->second.map.end())
                {
                    entry = nodes[it->second->second.dfa_set];
                    break;
                }
            }

            if(entry)
                continue;

            // No transition; accept the best token, if any.
            unsigned best_index = -1;
            for(dfa_node_t const* np : *node_vector[j])
            {
                auto it = np->second.map.find(ACCEPT);
                if(it != np->second.map.end())
                    best_index = std::min(best_index, nodes[it->second->second.dfa_set]);
            }
            if(best_index != -1u)
                entry = best_index;
        }
    }
    assert(ttable.size() < 65536);

    std::fprintf(cpp, "extern token_type_t const lexer_transition_table[%u] = {", (unsigned)ttable.size());
    for(unsigned i = 0; i < ttable.size(); ++i)
        std::fprintf(cpp, "%s%u,", i % 16 == 0 ? "\n    " : " ", ttable[i]);
    std::fprintf(cpp, "\n};\n");

    std::fprintf(hpp, "extern unsigned const lexer_ec_table[256];\n");
    std::fprintf(hpp, "extern token_type_t const lexer_transition_table[%u];\n", (unsigned)ttable.size());

    std::fprintf(hpp, "} // namespace %s\n", name_space);
    std::fprintf(hpp, "#endif\n");
    std::fprintf(cpp, "} // namespace %s\n", name_space);

    std::fclose(hpp);
    std::fclose(cpp);
}

bool is_idchar(unsigned char c)
    { return c == '_' || std::isalnum(c); }
bool is_idstart(unsigned char c)
    { return c == '_' || std::isalpha(c); }

rptr idchar() { return pred(is_idchar); }
rptr idstart() { return pred(is_idstart); }
rptr comchar() { return pred([](unsigned char c) { return c != '\n' && c != '\r' && c; }); }
rptr strchar() { return pred([](unsigned char c) { return c != '"' && c != '\n' && c != '\r' && c; }); }
rptr eof() { return pred([](unsigned char c) { return c == '\0'; }); }
rptr whitespace() { return pred([](unsigned char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }); }
rptr digit() { return pred(isdigit); }

int main(int argc, char** argv)
{
    fs::path const dir = argc > 1 ? fs::path(argv[1]) : fs::path(".");

    // The order below fixes the token numbering: keywords are contiguous,
    // then symbols are contiguous, which token.hpp depends on.
    std::deque<nfa_node_t> nfa_nodes;
    nfa_t nfa = gen_nfa(*uor(
        accept("eof", "file ending", eof()),
        accept("comment", "single-line comment", cat(word("//"), kleene(comchar()))),
        accept("ml_comment_begin", "multi-line comment", word("/*")),
        accept("whitespace", "space", many1(whitespace())),

        // Keywords
        keyword("class"),
        keyword("constructor"),
        keyword("function"),
        keyword("method"),
        keyword("field"),
        keyword("static"),
        keyword("var"),
        keyword("int"),
        keyword("char"),
        keyword("boolean"),
        keyword("void"),
        keyword("true"),
        keyword("false"),
        keyword("null"),
        keyword("this"),
        keyword("let"),
        keyword("do"),
        keyword("if"),
        keyword("else"),
        keyword("while"),
        keyword("return"),

        // Symbols
        symbol("lbrace", "{"),
        symbol("rbrace", "}"),
        symbol("lparen", "("),
        symbol("rparen", ")"),
        symbol("lbracket", "["),
        symbol("rbracket", "]"),
        symbol("period", "."),
        symbol("comma", ","),
        symbol("semicolon", ";"),
        symbol("plus", "+"),
        symbol("minus", "-"),
        symbol("asterisk", "*"),
        symbol("fslash", "/"),
        symbol("ampersand", "&"),
        symbol("pipe", "|"),
        symbol("lt", "<"),
        symbol("gt", ">"),
        symbol("eq", "="),
        symbol("tilde", "~"),

        // Constants and identifiers
        accept("integer", "integer constant", many1(digit())),
        accept("string", "string constant", cat(word("\""), kleene(strchar()), word("\""))),
        accept("ident", "identifier", cat(idstart(), kleene(idchar())))
        ),
        nfa_nodes);
    dfa_t dfa = nfa_to_dfa(nfa);
    print_output(dfa, minimize_dfa(dfa), dir, "lex");
}
