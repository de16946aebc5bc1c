#ifndef POPSUM_POPULATION_MISSING_VALUE_H_
#define POPSUM_POPULATION_MISSING_VALUE_H_

/*
    popsum - Population genetic summary statistics
    Copyright (C) 2024 Lucas Czech

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.

    Contact:
    Lucas Czech <lczech@carnegiescience.edu>
    Department of Plant Biology, Carnegie Institution For Science
    260 Panama Street, Stanford, CA 94305, USA
*/

#include <cstddef>
#include <stdexcept>

// =================================================================================================
//      Maybe Value
// =================================================================================================

/**
 * @brief Value that is either defined, or explicitly missing.
 *
 * We use this instead of NaN to mark statistics that cannot be computed, such as ratios with a
 * zero denominator, or derived allele counts of sites with unknown ancestral state. Missing
 * values compare equal to each other and unequal to every defined value, and are written as the
 * n/a entry in output tables.
 */
template<typename T>
class MaybeValue
{
public:

    // -------------------------------------------------------------------------
    //     Constructors and Rule of Five
    // -------------------------------------------------------------------------

    /**
     * @brief Default constructed values are missing.
     */
    MaybeValue() = default;

    MaybeValue( T const& value )
        : defined_( true )
        , value_( value )
    {}

    ~MaybeValue() = default;

    MaybeValue( MaybeValue const& ) = default;
    MaybeValue( MaybeValue&& )      = default;

    MaybeValue& operator= ( MaybeValue const& ) = default;
    MaybeValue& operator= ( MaybeValue&& )      = default;

    static MaybeValue missing()
    {
        return MaybeValue();
    }

    // -------------------------------------------------------------------------
    //     Accessors
    // -------------------------------------------------------------------------

    bool is_defined() const
    {
        return defined_;
    }

    bool is_missing() const
    {
        return ! defined_;
    }

    explicit operator bool() const
    {
        return defined_;
    }

    /**
     * @brief Get the value, or throw if it is missing.
     */
    T const& value() const
    {
        if( ! defined_ ) {
            throw std::domain_error( "Access to the value of a missing statistic." );
        }
        return value_;
    }

    T value_or( T const& fallback ) const
    {
        return defined_ ? value_ : fallback;
    }

    // -------------------------------------------------------------------------
    //     Comparison
    // -------------------------------------------------------------------------

    bool operator == ( MaybeValue const& other ) const
    {
        if( defined_ != other.defined_ ) {
            return false;
        }
        return ! defined_ || value_ == other.value_;
    }

    bool operator != ( MaybeValue const& other ) const
    {
        return !( *this == other );
    }

    // -------------------------------------------------------------------------
    //     Data Members
    // -------------------------------------------------------------------------

private:

    bool defined_ = false;
    T    value_   = T{};
};

using MaybeDouble = MaybeValue<double>;
using MaybeCount  = MaybeValue<size_t>;

/**
 * @brief Ratio of two sums, which is missing if the denominator is not positive.
 */
inline MaybeDouble ratio_or_missing( double numerator, double denominator )
{
    if( denominator > 0.0 ) {
        return MaybeDouble( numerator / denominator );
    }
    return MaybeDouble::missing();
}

#endif // include guard
