#ifndef SYMBOL_TABLE_HPP
#define SYMBOL_TABLE_HPP

#include <array>
#include <cstdint>
#include <string_view>

#include <boost/container/small_vector.hpp>

#include "ast.hpp"

namespace bc = boost::container;

// The four variable namespaces.
enum var_kind_t : char
{
    VAR_STATIC,
    VAR_FIELD,
    VAR_ARGUMENT,
    VAR_LOCAL,
};

std::string_view to_string(var_kind_t kind);

struct symbol_t
{
    type_name_t type;
    unsigned index;
};

// One namespace of variables, implemented as an association list.
// Every insertion gets the next index, even when it shadows an older entry
// with the same name. Lookups find the newest entry.
class symbol_map_t
{
public:
    using hash_type = std::uint32_t;

    // Returns the new symbol's index.
    unsigned insert(std::string_view name, type_name_t type);

    symbol_t const* find(std::string_view name) const;

    unsigned count() const { return assoc_list.size(); }

private:
    struct storage_t
    {
        std::string_view name;
        hash_type hash;
        symbol_t symbol;
    };

    bc::small_vector<storage_t, 16> assoc_list;

    // A count of zero for a name's hash implies it's not in the list,
    // which makes misses (the common case in resolution) cheap.
    static constexpr std::size_t table_size = 64; // Must be power of 2.
    static constexpr hash_type table_mask = table_size - 1;
    std::array<unsigned, table_size> hash_counts = {};
};

// Read access shared by the class and subroutine scopes.
class symbol_scope_t
{
public:
    virtual ~symbol_scope_t() = default;

    // Returns null if 'name' isn't declared as 'kind' in this scope,
    // including when this scope doesn't hold 'kind' at all.
    virtual symbol_t const* find(var_kind_t kind, std::string_view name) const = 0;

    virtual unsigned count(var_kind_t kind) const = 0;
};

// Statics and fields, living as long as the class compiler.
class class_symbol_table_t final : public symbol_scope_t
{
public:
    unsigned insert_static(std::string_view name, type_name_t type) { return statics.insert(name, type); }
    unsigned insert_field(std::string_view name, type_name_t type) { return fields.insert(name, type); }

    symbol_t const* get_static(std::string_view name) const { return statics.find(name); }
    symbol_t const* get_field(std::string_view name) const { return fields.find(name); }

    unsigned num_statics() const { return statics.count(); }
    unsigned num_fields() const { return fields.count(); }

    symbol_t const* find(var_kind_t kind, std::string_view name) const override;
    unsigned count(var_kind_t kind) const override;

private:
    symbol_map_t statics;
    symbol_map_t fields;
};

// Arguments and locals, living as long as one subroutine compiler.
class subroutine_symbol_table_t final : public symbol_scope_t
{
public:
    unsigned insert_argument(std::string_view name, type_name_t type) { return arguments.insert(name, type); }
    unsigned insert_var(std::string_view name, type_name_t type) { return vars.insert(name, type); }

    symbol_t const* get_argument(std::string_view name) const { return arguments.find(name); }
    symbol_t const* get_var(std::string_view name) const { return vars.find(name); }

    unsigned num_arguments() const { return arguments.count(); }
    unsigned num_vars() const { return vars.count(); }

    symbol_t const* find(var_kind_t kind, std::string_view name) const override;
    unsigned count(var_kind_t kind) const override;

private:
    symbol_map_t arguments;
    symbol_map_t vars;
};

#endif
