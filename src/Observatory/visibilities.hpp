/*
 * visibilities.hpp
 *
 * Result of a visibility computation: a dense (Nblts, Nskies, Nfreqs)
 * tensor of complex flux densities (Jy) plus, for every row, the time
 * (Julian date), time index and baseline index it belongs to.
 */

#ifndef EORSKY_VISIBILITIESH
#define EORSKY_VISIBILITIESH

#include <complex>
#include <vector>

struct VisibilitySet
{
    VisibilitySet() : nblts(0), nskies(0), nfreqs(0) {};

    long nblts;
    int nskies;
    int nfreqs;

    /* row-major (blt, sky, freq). */
    std::vector< std::complex<double> > data;
    /* Julian date of every row. */
    std::vector<double> time_array;
    /* index into the observatory time list of every row. */
    std::vector<long> time_index;
    /* index into the observatory baseline list of every row. */
    std::vector<int> baseline_array;

    std::complex<double> at(long blt, int sky, int freq) const
    {
        return data[(blt * nskies + sky) * nfreqs + freq];
    };
};

#endif
