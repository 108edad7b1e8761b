// XML_Tools.cc - A part of Kinefit 2026.
//
// The code in this file can be used to parse XML files into a nested tree of objects.
//

#include <string>
#include <map>
#include <vector>
#include <list>
#include <optional>
#include <istream>
#include <cctype>
#include <cstdint>
#include <exception>
#include <stdexcept>

#include "XML_Tools.h"


namespace {

std::string
trim_outer_whitespace(const std::string &buf){
    std::string out;
    const std::string space = " \n\r\t\f\v";

    const auto pos_A = buf.find_first_not_of(space);
    if(pos_A != std::string::npos){
        const auto pos_B = buf.find_last_not_of(space);
        out = buf.substr(pos_A, 1 + pos_B - pos_A);
    }
    return out;
}

// Replaces the predefined entities. Unrecognized entities are left as-is.
std::string
decode_entities(const std::string &in){
    const std::vector<std::pair<std::string, char>> entities = {{ { "&lt;",   '<'  },
                                                                  { "&gt;",   '>'  },
                                                                  { "&amp;",  '&'  },
                                                                  { "&quot;", '"'  },
                                                                  { "&apos;", '\'' } }};
    std::string out;
    out.reserve(in.size());
    for(size_t i = 0; i < in.size(); ++i){
        bool replaced = false;
        if(in[i] == '&'){
            for(const auto &e : entities){
                if(in.compare(i, e.first.size(), e.first) == 0){
                    out.push_back(e.second);
                    i += e.first.size() - 1;
                    replaced = true;
                    break;
                }
            }
        }
        if(!replaced) out.push_back(in[i]);
    }
    return out;
}

// Consumes a '<!-- ... -->' comment or '<!...>' declaration. The leading '<' has already been consumed.
void
skip_markup_declaration(std::istream &is){
    std::string opener;
    char c = '\0';
    for(int i = 0; (i < 3) && is.get(c); ++i){
        opener.push_back(c);
        if(c == '>') return;
    }

    if(opener == "!--"){
        std::string tail;
        while(is.get(c)){
            tail.push_back(c);
            if(3 < tail.size()) tail.erase(tail.begin());
            if(tail == "-->") return;
        }
        throw std::runtime_error("Unterminated comment");
    }

    while(is.get(c)){
        if(c == '>') return;
    }
    throw std::runtime_error("Unterminated declaration");
}

} // namespace


void
kfit::xml::read_node( std::istream &is,
                      kfit::xml::node &root ){
    // Buffer parsing:
    // - look for enclosing '<!-- -->' or '<! >'. If present, skip it entirely.
    // - look for enclosing '<? ?>'. If present, treat this as a special node by *not* recursing.
    // - look for enclosing '</ >'. If present, look for the name.
    // - look for enclosing '< >'. If present, look for name and metadata.
    // - otherwise, the buffer only contains content.
    enum class tag_type_t {
        header,   // Like '<? ... ?>'.
        opening,  // Like '< ... >'.
        closing,  // Like '</ ... >'.
        combo,    // Like '<... />'.
    } tag_type = tag_type_t::opening;

    bool escaped = false;
    bool inside_tag = false; // Between '<' and '>'.
    std::vector<char> quotes;
    std::string buf;
    std::string key; // Used to temporarily store key=value statements.

    std::list<kfit::xml::node> work_nodes;
    work_nodes.emplace_back();

    const auto clear_buf = [&](){
        buf = trim_outer_whitespace(buf);

        if(buf.empty()){
            // Do nothing.
        }else if(!key.empty()){
            work_nodes.back().metadata[key] = decode_entities(buf);
        }else if(work_nodes.back().name.empty()){
            work_nodes.back().name = buf;
        }else{
            throw std::runtime_error("Unrecognized structure in tag '" + work_nodes.back().name + "'");
        }
        key.clear();
        buf.clear();
        return;
    };

    // Remove preceding whitespace.
    is >> std::ws;

    // Read until you have an *unescaped* and *unquoted* '<' or '>' char. Add every char to the buffer (for later sub-parsing).
    char c = '\0';
    char prev_c = '\0';
    while(is.get(c)){

        // Handle quotes.
        if( inside_tag && !escaped && ( (c == '"') || (c == '\'') ) ){
            if(!quotes.empty() && (quotes.back() == c)){
                quotes.pop_back();
            }else{
                quotes.push_back(c);
            }

        // Handle escapes.
        }else if( inside_tag && !escaped && !quotes.empty() && (c == '\\') ){
            escaped = true;

        // Handle '<' opening a new tag.
        }else if( !inside_tag && !escaped && quotes.empty() && (c == '<') ){
            // If there is something in the buffer, assume it is enclosed content for the preceding tag.
            buf = trim_outer_whitespace(buf);
            if(!buf.empty()){
                root.content += decode_entities(buf);
                buf.clear();
            }

            if(is.peek() == '!'){
                skip_markup_declaration(is);
                prev_c = '>';
                continue;
            }
            inside_tag = true;
            tag_type = tag_type_t::opening;

        // Handle '>' closing a tag.
        }else if( inside_tag && !escaped && quotes.empty() && (c == '>') ){
            // Handle any outstanding content in the buffer.
            clear_buf();

            if(tag_type == tag_type_t::opening){
                // Handle "<abc>" tags.
                //
                // Create tag in the root, then recurse to read the child.
                root.children.splice( root.children.end(), work_nodes );
                work_nodes.clear();
                work_nodes.emplace_back();

                read_node( is, root.children.back() );

            }else if( (tag_type == tag_type_t::header)
                  ||  (tag_type == tag_type_t::combo) ){
                // Handle "<? abc ?>" and "<abc />" tags.
                //
                // Create tag in the root, but do not recurse since there is no corresponding closing tag.
                root.children.splice( root.children.end(), work_nodes );
                work_nodes.clear();
                work_nodes.emplace_back();

            }else if(tag_type == tag_type_t::closing){
                // Handle closing tags where the current name "</abc>" matches the parent's name "<abc>".
                //
                // Ensure the tag name matches the root, and then return control to the parent in case there are siblings
                // to this node.
                const auto l_name = work_nodes.back().name;
                const auto r_name = root.name;
                if(l_name != r_name){
                    throw std::runtime_error("Mismatched opening/closing tags: '" + r_name + "' closed by '" + l_name + "'");
                }
                return;
            }
            inside_tag = false;

        // Handle '=' inside a tag.
        }else if( inside_tag && !escaped && quotes.empty() && (c == '=') ){
            buf = trim_outer_whitespace(buf);
            if(buf.empty()){
                throw std::runtime_error("Key-value metadata assignment attempted without a valid key");
            }else if(!key.empty()){
                throw std::runtime_error("Key-value metadata assignment attempted with existing key");
            }
            key = buf;
            buf.clear();

        // Handle whitespace inside a tag.
        }else if( inside_tag && !escaped && quotes.empty() && std::isspace(static_cast<unsigned char>(c)) ){
            // Permit whitespace after '=' by deferring until a value is seen.
            if(key.empty() || !buf.empty()) clear_buf();

        // Handle '?' inside a tag.
        }else if( inside_tag && !escaped && quotes.empty() && (c == '?') ){
            // This is to handle tags like "<?xml version='1.0' encoding='UTF-8' standalone='yes' ?>".
            tag_type = tag_type_t::header;

        // Handle '/' inside a tag.
        }else if( inside_tag && !escaped && quotes.empty() && (c == '/') ){
            // This is to handle closing tags like "</abc>".
            if(prev_c == '<'){
                tag_type = tag_type_t::closing;

            // This is to handle 'combo' tags like "<abc />".
            }else{
                tag_type = tag_type_t::combo;
            }

        // Plain input.
        }else{
            buf.push_back(c);
            escaped = false;
        }

        prev_c = c;
    }

    if(inside_tag){
        throw std::runtime_error("Unterminated tag");
    }
    if(!root.name.empty()){
        throw std::runtime_error("Element '" + root.name + "' was not closed");
    }
    buf = trim_outer_whitespace(buf);
    if(!buf.empty()){
        throw std::runtime_error("Stray content outside of any element");
    }
    return;
}

std::optional<std::string>
kfit::xml::child_content( kfit::xml::node &root, std::initializer_list<std::string> names ){
    std::optional<std::string> out;
    kfit::xml::search_callback_t f = [&](const kfit::xml::node_chain_t &nc) -> bool {
        out = trim_outer_whitespace(nc.back().get().content);
        return false;
    };
    kfit::xml::search_by_names(root, std::begin(names), std::end(names), f, false);
    return out;
}

std::list<std::reference_wrapper<kfit::xml::node>>
kfit::xml::children_named( kfit::xml::node &root, const std::string &name ){
    std::list<std::reference_wrapper<kfit::xml::node>> out;
    for(auto &c : root.children){
        if(c.name == name) out.emplace_back(std::ref(c));
    }
    return out;
}

