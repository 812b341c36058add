/*
  Copyright (C) 2022-2024 Jerry R. VanAken

  This software is provided 'as-is', without any express or implied
  warranty. In no event will the authors be held liable for any damages
  arising from the use of this software.

  Permission is granted to anyone to use this software for any purpose,
  including commercial applications, and to alter it and redistribute it
  freely, subject to the following restrictions:

  1. The origin of this software must not be misrepresented; you must not
     claim that you wrote the original software. If you use this software
     in a product, an acknowledgment in the product documentation would be
     appreciated but is not required.

  2. Altered source versions must be plainly marked as such, and must not be
     misrepresented as being the original software.

  3. This notice may not be removed or altered from any source distribution.
*/
//---------------------------------------------------------------------
//
//  fill.cpp:
//    This file contains the functions that fill a pixel buffer with
//    an angle gradient. This code is platform-INdependent: it writes
//    directly to a window-backing buffer (or back buffer) that is
//    described by a PIXEL_BUFFER structure. A 32-bit buffer has a BGRA
//    pixel format (that is, 0xaarrggbb), and an 8-bit buffer holds
//    gray levels. Pixels in the buffer are overwritten, not blended.
//
//---------------------------------------------------------------------

#include <stdint.h>
#include <string.h>
#include <new>
#include "anglegen.h"

//---------------------------------------------------------------------
//
// Utilities for manipulating channel buffers
//
//---------------------------------------------------------------------

// Allocates a memory buffer that can hold a rectangular image of
// width 'w' and height 'h', with 'nchan' 8-bit channels per pixel,
// where the rows occupy contiguous memory. Fills every channel with
// the value 'fill', which is optional and defaults to 0. The function
// returns a pointer to the buffer, or zero if the parameters are bad
// or the memory cannot be allocated.
unsigned char* AllocateRawChannels(int w, int h, int nchan, unsigned char fill)
{
    if (w <= 0 || h <= 0 || nchan <= 0)
        return 0;  // bad parameters

    if (size_t(h) > size_t(PTRDIFF_MAX)/nchan/w)
        return 0;  // buffer size overflows

    size_t len = size_t(w)*h*nchan;
    unsigned char *buf = new(std::nothrow) unsigned char[len];

    if (buf == 0)
        return 0;

    memset(buf, fill, len);
    return buf;
}

// Deletes a buffer that was previously allocated by the
// AllocateRawChannels function. Always returns zero.
unsigned char* DeleteRawChannels(unsigned char *buf)
{
    if (buf) { delete[] buf; }
    return 0;
}

namespace {
    // Packs r,g,b,a channel samples into BGRA32 pixels (0xaarrggbb),
    // or into RGBA32 pixels (0xaabbggrr) if 'swap' is true
    void StorePixels32(COLOR *dst, const unsigned char *src, int len, bool swap)
    {
        for (int i = 0; i < len; ++i)
        {
            COLOR r = src[0], g = src[1], b = src[2], a = src[3];

            if (swap)
                dst[i] = (a << 24) | (b << 16) | (g << 8) | r;
            else
                dst[i] = (a << 24) | (r << 16) | (g << 8) | b;

            src += 4;
        }
    }
}

// Fills the entire pixel buffer 'pixbuf' with an angle gradient that
// is defined by the drag geometry, the start and end colors, and the
// cycle method. A 32-bit buffer receives full-color pixels; an 8-bit
// buffer receives gray levels taken from the red channels of the two
// colors. If 'flags' includes FLAG_INVERT, the start and end colors
// are swapped. The rows are divided among 'nthreads' worker threads.
// The function returns false, and leaves the buffer untouched, if the
// drag is a click (zero length), if 'pixbuf' is not valid, or if the
// sample buffer cannot be allocated.
bool DrawAngleGradient(const PIXEL_BUFFER& pixbuf, const DragGeometry& drag,
                       COLOR startColor, COLOR endColor, CYCLE_METHOD cycle,
                       int flags, int nthreads, const AA_SETTINGS *aa)
{
    if (drag.IsClick())
        return false;  // nothing to draw

    if (pixbuf.pixels == 0 || pixbuf.width <= 0 || pixbuf.height <= 0)
        return false;  // bad pixel buffer

    int bytesPerPixel = pixbuf.depth/8;
    if ((pixbuf.depth != 32 && pixbuf.depth != 8) || pixbuf.pitch <= 0 ||
        size_t(pixbuf.pitch) < size_t(pixbuf.width)*bytesPerPixel)
    {
        return false;  // unsupported pixel format
    }

    if (flags & FLAG_INVERT)
    {
        COLOR tmp = startColor;
        startColor = endColor;
        endColor = tmp;
    }

    CHANNEL_LAYOUT layout = (pixbuf.depth == 8) ? LAYOUT_GRAY : LAYOUT_RGBA;
    SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, startColor, endColor,
                                                     cycle, layout, aa));
    if (grad.get() == 0)
        return false;

    int nchan = grad->GetChannelCount();
    unsigned char *samples = AllocateRawChannels(pixbuf.width, pixbuf.height, nchan);
    if (samples == 0)
        return false;  // out of memory

    AGRect rect = { 0, 0, pixbuf.width, pixbuf.height };

    grad->FillRect(rect, samples, nthreads);

    // Copy the samples, one row at a time, to the pixel buffer
    unsigned char *prow = static_cast<unsigned char*>(pixbuf.pixels);
    const unsigned char *src = samples;
    bool swap = (flags & FLAG_SWAP_REDBLUE) != 0;

    for (int j = 0; j < pixbuf.height; ++j)
    {
        if (nchan == 1)
            memcpy(prow, src, pixbuf.width);
        else
            StorePixels32(reinterpret_cast<COLOR*>(prow), src, pixbuf.width, swap);

        prow += pixbuf.pitch;
        src += size_t(pixbuf.width)*nchan;
    }
    DeleteRawChannels(samples);
    return true;
}
