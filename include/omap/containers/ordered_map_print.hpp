#pragma once

#include "ordered_map.hpp"

#include <cstddef>
#include <ostream>
//------------------------------------------------------------------------------
namespace omap
{
//------------------------------------------------------------------------------

template <typename Key, typename T, typename Store, typename KeyContainer>
void print( std::ostream & out, ordered_map<Key, T, Store, KeyContainer> const & map )
{
    if ( map.empty() )
    {
        out << "The map is empty.\n";
        return;
    }

    std::size_t pos{ 0 };
    for ( auto const [key, value] : map )
    {
        out << '[' << pos++ << "]\t" << key << ": " << value << '\n';
    }
    out << " [" << map.size() << " entries]\n";
}

//------------------------------------------------------------------------------
} // namespace omap
//------------------------------------------------------------------------------
