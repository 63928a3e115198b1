#ifndef VM_HPP
#define VM_HPP

// The stack machine's instruction vocabulary, and writing it out as text.

#include <string>
#include <string_view>
#include <vector>

#include "file.hpp"

#define VM_SEGMENT_XENUM \
    X(SEG_ARGUMENT, "argument") \
    X(SEG_LOCAL,    "local") \
    X(SEG_STATIC,   "static") \
    X(SEG_CONSTANT, "constant") \
    X(SEG_THIS,     "this") \
    X(SEG_THAT,     "that") \
    X(SEG_POINTER,  "pointer") \
    X(SEG_TEMP,     "temp")

enum vm_segment_t : char
{
#define X(name, str) name,
    VM_SEGMENT_XENUM
#undef X
};

#define VM_OP_XENUM \
    X(VM_ADD, "add") \
    X(VM_SUB, "sub") \
    X(VM_NEG, "neg") \
    X(VM_EQ,  "eq") \
    X(VM_GT,  "gt") \
    X(VM_LT,  "lt") \
    X(VM_AND, "and") \
    X(VM_OR,  "or") \
    X(VM_NOT, "not")

enum vm_op_t : char
{
#define X(name, str) name,
    VM_OP_XENUM
#undef X
};

std::string_view to_string(vm_segment_t segment);
std::string_view to_string(vm_op_t op);

std::string vm_push(vm_segment_t segment, unsigned index);
std::string vm_pop(vm_segment_t segment, unsigned index);
std::string vm_op(vm_op_t op);
std::string vm_label(std::string_view label);
std::string vm_goto(std::string_view label);
std::string vm_if_goto(std::string_view label);
std::string vm_function(std::string_view class_name, std::string_view name, unsigned num_locals);
std::string vm_call(std::string_view class_name, std::string_view name, unsigned num_args);
std::string vm_return();

// Joins 'lines' with '\n', without a trailing newline.
// With 'indent', lines other than 'function' and 'label' get four spaces.
std::string vm_text(std::vector<std::string> const& lines, bool indent);

// Throws std::runtime_error if the file can't be written.
void write_vm_file(fs::path const& path, std::vector<std::string> const& lines, bool indent);

#endif
