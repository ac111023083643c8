/*
 * skyshell.hpp
 *
 * SkyShell stores a HEALPix (RING ordering) brightness temperature cube
 * indexed by (sky realization, pixel, frequency channel). The buffer is a
 * shared anonymous memory region so that every worker of a visibility
 * computation reads the same copy. Workers only get const access.
 *
 */

#ifndef EORSKY_SKYSHELLH
#define EORSKY_SKYSHELLH

#include <string>

class SkyShell
{
    public:
        /* creates a shell with nskies realizations of npix pixels and
         * nfreqs channels. The pixel count is validated on use. */
        SkyShell(long npix, int nfreqs, int nskies = 1);
       ~SkyShell(void);

        SkyShell(const SkyShell&) = delete;
        SkyShell& operator=(const SkyShell&) = delete;

        /* returns Nside such that npix = 12 Nside^2. Throws if invalid. */
        static int npix2nside(long npix);

        int get_nside(void) const;
        long get_npixels(void) const { return nPixels; };
        int get_nfreqs(void) const { return nFreqs; };
        int get_nskies(void) const { return nSkies; };
        /* size of the buffer in bytes. */
        size_t nbytes(void) const { return skyBufferSize; };

        /* brightness temperature at (sky, pixel, channel). */
        double get_value(int sky, long pix, int freq) const
        {
            return T[(sky * nPixels + pix) * nFreqs + freq];
        };
        void set_value(int sky, long pix, int freq, double value)
        {
            T[(sky * nPixels + pix) * nFreqs + freq] = value;
        };
        /* pointer to the nfreqs values of a pixel. */
        const double* get_pixel(int sky, long pix) const
        {
            return T + (sky * nPixels + pix) * nFreqs;
        };
        const double* get_data(void) const;

        /* sets every value in the shell. */
        void fill(double value);
        /* loads realization `sky` from a text file with one line per pixel
         * and nfreqs columns. */
        void load_sky_data_from_txt(std::string path, int sky = 0);
        /* draws every value from a zero-mean normal distribution. */
        void make_gaussian_random_sky(double sigma, unsigned int seed);
        /* zero everywhere except the pixel containing (ra0, dec0). */
        void make_point_source_sky(double ra0, double dec0, double T0);

    private:

        void allocate_buffers(void);
        void free_buffers(void);

        double* T;

        long nPixels;
        int nFreqs;
        int nSkies;
        size_t skyBufferSize;
        bool buffersOK;
};

#endif
