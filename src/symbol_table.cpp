#include "symbol_table.hpp"

#include "fnv1a.hpp"

std::string_view to_string(var_kind_t kind)
{
    switch(kind)
    {
    case VAR_STATIC:   return "static";
    case VAR_FIELD:    return "field";
    case VAR_ARGUMENT: return "argument";
    case VAR_LOCAL:    return "var";
    }
    return "?BAD?";
}

unsigned symbol_map_t::insert(std::string_view name, type_name_t type)
{
    hash_type const hash = fnv1a<hash_type>::hash(name);
    unsigned const index = assoc_list.size();
    assoc_list.push_back({ name, hash, { type, index } });
    ++hash_counts[hash & table_mask];
    return index;
}

symbol_t const* symbol_map_t::find(std::string_view name) const
{
    // Early exit if the list doesn't hold the hash.
    hash_type const hash = fnv1a<hash_type>::hash(name);
    if(hash_counts[hash & table_mask] == 0)
        return nullptr;

    // Linear search backwards, so that the newest entry wins.
    for(auto it = assoc_list.rbegin(); it != assoc_list.rend(); ++it)
        if(it->hash == hash && it->name == name)
            return &it->symbol;

    return nullptr;
}

symbol_t const* class_symbol_table_t::find(var_kind_t kind, std::string_view name) const
{
    switch(kind)
    {
    case VAR_STATIC: return statics.find(name);
    case VAR_FIELD:  return fields.find(name);
    default:         return nullptr;
    }
}

unsigned class_symbol_table_t::count(var_kind_t kind) const
{
    switch(kind)
    {
    case VAR_STATIC: return statics.count();
    case VAR_FIELD:  return fields.count();
    default:         return 0;
    }
}

symbol_t const* subroutine_symbol_table_t::find(var_kind_t kind, std::string_view name) const
{
    switch(kind)
    {
    case VAR_ARGUMENT: return arguments.find(name);
    case VAR_LOCAL:    return vars.find(name);
    default:           return nullptr;
    }
}

unsigned subroutine_symbol_table_t::count(var_kind_t kind) const
{
    switch(kind)
    {
    case VAR_ARGUMENT: return arguments.count();
    case VAR_LOCAL:    return vars.count();
    default:           return 0;
    }
}
