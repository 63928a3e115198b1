#include "vm.hpp"

#include <cstdio>
#include <stdexcept>

#include "format.hpp"
#include "guard.hpp"

std::string_view to_string(vm_segment_t segment)
{
    switch(segment)
    {
#define X(name, str) case name: return str;
    VM_SEGMENT_XENUM
#undef X
    }
    return "?BAD?";
}

std::string_view to_string(vm_op_t op)
{
    switch(op)
    {
#define X(name, str) case name: return str;
    VM_OP_XENUM
#undef X
    }
    return "?BAD?";
}

std::string vm_push(vm_segment_t segment, unsigned index)
    { return fmt("push % %", to_string(segment), index); }

std::string vm_pop(vm_segment_t segment, unsigned index)
    { return fmt("pop % %", to_string(segment), index); }

std::string vm_op(vm_op_t op)
    { return std::string(to_string(op)); }

std::string vm_label(std::string_view label)
    { return fmt("label %", label); }

std::string vm_goto(std::string_view label)
    { return fmt("goto %", label); }

std::string vm_if_goto(std::string_view label)
    { return fmt("if-goto %", label); }

std::string vm_function(std::string_view class_name, std::string_view name, unsigned num_locals)
    { return fmt("function %.% %", class_name, name, num_locals); }

std::string vm_call(std::string_view class_name, std::string_view name, unsigned num_args)
    { return fmt("call %.% %", class_name, name, num_args); }

std::string vm_return()
    { return "return"; }

namespace
{
    bool is_unindented(std::string const& line)
    {
        using namespace std::literals;
        std::string_view const view = line;
        return view.substr(0, 9) == "function "sv || view.substr(0, 6) == "label "sv;
    }
}

std::string vm_text(std::vector<std::string> const& lines, bool indent)
{
    std::string text;
    for(std::size_t i = 0; i < lines.size(); ++i)
    {
        if(i)
            text.push_back('\n');
        if(indent && !is_unindented(lines[i]))
            text += "    ";
        text += lines[i];
    }
    return text;
}

void write_vm_file(fs::path const& path, std::vector<std::string> const& lines, bool indent)
{
    std::string const text = vm_text(lines, indent);

    FILE* fp = std::fopen(path.string().c_str(), "wb");
    if(!fp)
        throw std::runtime_error(fmt("Unable to open file %", path.string()));
    auto scope_guard = make_scope_guard([&]{ std::fclose(fp); });

    if(!text.empty() && std::fwrite(text.data(), text.size(), 1, fp) != 1)
        throw std::runtime_error(fmt("Unable to write to file %", path.string()));
}
