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
// gradient.cpp:
//   Paint generator class for angle gradient fills, and the channel
//   mixers that blend the gradient's start and end colors
//
//---------------------------------------------------------------------

#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <assert.h>
#include <system_error>
#include <thread>
#include <vector>
#include "anglegen.h"

// Maximum number of channels in a sample
const int MAX_CHANNELS = 4;

// Reports an internal contract violation, such as an undefined cycle
// method, and terminates the program. Never returns.
void FatalError(const char *text)
{
    fprintf(stderr, "ERROR-- %s\n", text);
    fflush(stderr);
    abort();
}

//---------------------------------------------------------------------
//
// Cycle method names
//
//---------------------------------------------------------------------

namespace {
    struct CYCLE_NAME
    {
        CYCLE_METHOD cycle;
        const char *name;       // name shown to users
        const char *shortname;  // name used on command lines
    };

    const CYCLE_NAME _cycleName[] =
    {
        { CYCLE_CLAMP,   "No Cycle", "clamp"   },
        { CYCLE_REFLECT, "Reflect",  "reflect" },
        { CYCLE_REPEAT,  "Repeat",   "repeat"  },
    };
}

const char* GetCycleMethodName(CYCLE_METHOD cycle)
{
    for (int i = 0; i < ARRAY_LEN(_cycleName); ++i)
    {
        if (_cycleName[i].cycle == cycle)
            return _cycleName[i].name;
    }
    FatalError("undefined gradient cycle method");
    return 0;
}

// Looks up a cycle method by name. Returns false if 'name' is not
// the name of a cycle method, in which case 'cycle' is unchanged.
bool ParseCycleMethod(const char *name, CYCLE_METHOD *cycle)
{
    if (name == 0 || cycle == 0)
    {
        assert(name != 0 && cycle != 0);
        return false;
    }
    for (int i = 0; i < ARRAY_LEN(_cycleName); ++i)
    {
        if (strcmp(name, _cycleName[i].name) == 0 ||
            strcmp(name, _cycleName[i].shortname) == 0)
        {
            *cycle = _cycleName[i].cycle;
            return true;
        }
    }
    return false;
}

// Folds a base fraction f through the specified cycle method. The
// base fraction is the pixel's angular position relative to the draw
// angle, normalized so that one revolution maps to the unit interval.
// Values of f outside the interval [0,1) are first wrapped into it,
// so that f = 1.0 and f = 0 are the same position (the seam).
double FoldFraction(double f, CYCLE_METHOD cycle)
{
    if (f < 0 || f >= 1.0)
    {
        f -= floor(f);
        if (f < 0 || f >= 1.0)  // handle tiny precision errors
            f = 0;
    }
    switch (cycle)
    {
    case CYCLE_CLAMP:
        return f;
    case CYCLE_REFLECT:
        return (f < 0.5) ? 2.0*f : 2.0*(1 - f);
    case CYCLE_REPEAT:
        return (f < 0.5) ? 2.0*f : 2.0*(f - 0.5);
    default:
        break;
    }
    FatalError("undefined gradient cycle method");
    return 0;
}

//---------------------------------------------------------------------
//
// Channel mixers -- Blend the start and end colors at fraction t
//
//---------------------------------------------------------------------

namespace {
    // Four channels, in r,g,b,a order
    class RgbaMixer : public ChannelMixer
    {
        int _start[MAX_CHANNELS];
        int _end[MAX_CHANNELS];

    public:
        RgbaMixer(COLOR startColor, COLOR endColor)
        {
            _start[0] = GetRed(startColor),   _end[0] = GetRed(endColor);
            _start[1] = GetGreen(startColor), _end[1] = GetGreen(endColor);
            _start[2] = GetBlue(startColor),  _end[2] = GetBlue(endColor);
            _start[3] = GetAlpha(startColor), _end[3] = GetAlpha(endColor);
        }
        int GetChannelCount() const
        {
            return 4;
        }
        void MixChannels(double t, double out[]) const
        {
            for (int c = 0; c < 4; ++c)
                out[c] = _start[c] + t*(_end[c] - _start[c]);
        }
    };

    // One gray channel, taken from the red channel of each color
    class GrayMixer : public ChannelMixer
    {
        int _startGray;
        int _endGray;

    public:
        GrayMixer(COLOR startColor, COLOR endColor) :
                _startGray(GetRed(startColor)), _endGray(GetRed(endColor))
        {
        }
        int GetChannelCount() const
        {
            return 1;
        }
        void MixChannels(double t, double out[]) const
        {
            out[0] = _startGray + t*(_endGray - _startGray);
        }
    };

    inline unsigned char ClampChannel(int value)
    {
        return (value < 0) ? 0 : (value > 255) ? 255 : value;
    }
} // end namespace

ChannelMixer* CreateChannelMixer(CHANNEL_LAYOUT layout, COLOR startColor, COLOR endColor)
{
    switch (layout)
    {
    case LAYOUT_RGBA:
        return new RgbaMixer(startColor, endColor);
    case LAYOUT_GRAY:
        return new GrayMixer(startColor, endColor);
    default:
        break;
    }
    FatalError("undefined channel layout");
    return 0;
}

//---------------------------------------------------------------------
//
// AngleGrad class -- Paint generator for angle gradient fills
//
//---------------------------------------------------------------------

class AngleGrad : public AngleGradient
{
    DragGeometry _drag;     // center and draw angle
    ChannelMixer *_mixer;   // blends start and end colors
    CYCLE_METHOD _cycle;    // clamp, reflect, or repeat
    AA_SETTINGS _aa;        // supersampling policy
    int _nchan;             // channels per sample
    bool _bOpaque;          // both colors are opaque

    AngleGrad(const AngleGrad&);             // not copyable: owns _mixer
    AngleGrad& operator=(const AngleGrad&);  //

    void SamplePixel(int x, int y, unsigned char out[]) const;
    static void FillBand(const AngleGrad *grad, int xs, int ys, int w, int h,
                         unsigned char outBuf[]);

public:
    AngleGrad(const DragGeometry& drag, COLOR startColor, COLOR endColor,
              CYCLE_METHOD cycle, CHANNEL_LAYOUT layout, const AA_SETTINGS& aa);
    ~AngleGrad()
    {
        delete _mixer;
    }
    int GetChannelCount() const
    {
        return _nchan;
    }
    CYCLE_METHOD GetCycleMethod() const
    {
        return _cycle;
    }
    bool IsOpaque() const
    {
        return _bOpaque;
    }
    double Interpolate(double x, double y) const;
    bool NeedsAntialiasing(double x, double y, double t) const;
    bool FillSpan(int xs, int ys, int len, unsigned char outBuf[]) const;
    bool FillRect(const AGRect& rect, unsigned char outBuf[], int nthreads) const;
};

AngleGrad::AngleGrad(const DragGeometry& drag, COLOR startColor, COLOR endColor,
                     CYCLE_METHOD cycle, CHANNEL_LAYOUT layout, const AA_SETTINGS& aa) :
             _drag(drag), _mixer(0), _cycle(cycle), _aa(aa), _nchan(0)
{
    _mixer = CreateChannelMixer(layout, startColor, endColor);
    _nchan = _mixer->GetChannelCount();
    _bOpaque = (GetAlpha(startColor) & GetAlpha(endColor)) == 0xff;
}

// Public function: Returns the interpolation fraction t at point
// (x,y), after t is folded by the cycle method. The pixel's angle is
// measured relative to the draw angle, so the relative angle lies in
// the range -2*PI to +2*PI, and the ranges -2*PI..0 and 0..2*PI are
// the same. Adding 1.0 after normalizing shifts the value into the
// range 0..2, and the fractional part is the base fraction in [0,1).
double AngleGrad::Interpolate(double x, double y) const
{
    double relAngle = _drag.GetAngleFromStartTo(x, y) - _drag.GetDrawAngle();
    double f = fmod(relAngle/(2*PI) + 1.0, 1.0);

    return FoldFraction(f, _cycle);
}

// Public function: Returns true if a pixel at (x,y) with interpolation
// fraction t lies close enough to a seam to need supersampling. The
// band around each seam narrows (in angle) as the distance from the
// drag start increases, which keeps it about the same width in pixels.
bool AngleGrad::NeedsAntialiasing(double x, double y, double t) const
{
    switch (_cycle)
    {
    case CYCLE_REFLECT:
        return false;  // no hard seams
    case CYCLE_CLAMP:
    case CYCLE_REPEAT:
        {
            double threshold = _aa.band/_drag.TaxiCabMetric(x, y);
            return t > (1.0 - threshold) || t < threshold;
        }
    default:
        break;
    }
    FatalError("undefined gradient cycle method");
    return false;
}

// Private function: Computes the channel values for the pixel at
// integer coordinates (x,y) and writes them to the 'out' array
void AngleGrad::SamplePixel(int x, int y, unsigned char out[]) const
{
    double val[MAX_CHANNELS];
    double t = Interpolate(x, y);

    if (!NeedsAntialiasing(x, y, t))
    {
        _mixer->MixChannels(t, val);
        for (int c = 0; c < _nchan; ++c)
            out[c] = ClampChannel(int(val[c]));

        return;
    }

    // Supersample the pixel on a res x res grid of subpixel offsets
    int res = _aa.res, count = res*res;
    int isum[MAX_CHANNELS] = { 0 };
    double fsum[MAX_CHANNELS] = { 0 };

    for (int m = 0; m < res; ++m)
    {
        double yy = y + 1.0/res*m - 0.5;
        for (int n = 0; n < res; ++n)
        {
            double xx = x + 1.0/res*n - 0.5;
            double tt = Interpolate(xx, yy);

            _mixer->MixChannels(tt, val);
            for (int c = 0; c < _nchan; ++c)
            {
                isum[c] += int(val[c]);
                fsum[c] += val[c];
            }
        }
    }
    for (int c = 0; c < _nchan; ++c)
    {
        if (_aa.accum == AA_ACCUM_FLOAT)
            out[c] = ClampChannel(int(fsum[c]/count + 0.5));
        else
            out[c] = ClampChannel(isum[c]/count);
    }
}

// Public function: Fills a single horizontal span of samples. The span
// starts at pixel (xs,ys) and extends 'len' pixels to the right. The
// function writes len*GetChannelCount() bytes to the outBuf array.
bool AngleGrad::FillSpan(int xs, int ys, int len, unsigned char outBuf[]) const
{
    if (len <= 0)
        return false;

    assert(outBuf != 0);
    for (int i = 0; i < len; ++i)
    {
        SamplePixel(xs + i, ys, outBuf);
        outBuf += _nchan;
    }
    return true;
}

// Private function: Fills 'h' rows of 'w' samples each, starting at
// pixel (xs,ys). Each worker thread in FillRect runs this function on
// its own band of rows.
void AngleGrad::FillBand(const AngleGrad *grad, int xs, int ys, int w, int h,
                         unsigned char outBuf[])
{
    size_t stride = size_t(w)*grad->_nchan;

    for (int j = 0; j < h; ++j)
    {
        grad->FillSpan(xs, ys + j, w, outBuf);
        outBuf += stride;
    }
}

// Public function: Fills the samples in rectangle 'rect' and writes
// them to outBuf in row-major order. If nthreads > 1, the rows are
// divided into contiguous bands that are filled in parallel. Each band
// writes to its own part of outBuf, so no locking is needed. The thread
// count is limited to the number of rows and to the number of hardware
// threads. Bands for which no worker thread can be started are filled
// by the calling thread.
bool AngleGrad::FillRect(const AGRect& rect, unsigned char outBuf[], int nthreads) const
{
    if (rect.w <= 0 || rect.h <= 0)
        return false;

    assert(outBuf != 0);
    unsigned int ncores = std::thread::hardware_concurrency();
    if (ncores > 0 && nthreads > int(ncores))
        nthreads = ncores;
    if (nthreads > rect.h)
        nthreads = rect.h;

    if (nthreads <= 1)
    {
        FillBand(this, rect.x, rect.y, rect.w, rect.h, outBuf);
        return true;
    }

    int rowsPerBand = (rect.h + nthreads - 1)/nthreads;
    size_t stride = size_t(rect.w)*_nchan;
    std::vector<std::thread> workers;
    int ystart = 0;

    workers.reserve(nthreads);
    for ( ; ystart < rect.h; ystart += rowsPerBand)
    {
        int rows = rect.h - ystart;

        if (rows > rowsPerBand)
            rows = rowsPerBand;

        try
        {
            workers.push_back(std::thread(FillBand, this, rect.x, rect.y + ystart,
                                          rect.w, rows, &outBuf[size_t(ystart)*stride]));
        }
        catch (const std::system_error&)
        {
            break;  // out of threads; this band is filled below
        }
    }
    for ( ; ystart < rect.h; ystart += rowsPerBand)
    {
        int rows = rect.h - ystart;

        if (rows > rowsPerBand)
            rows = rowsPerBand;

        FillBand(this, rect.x, rect.y + ystart, rect.w, rows,
                 &outBuf[size_t(ystart)*stride]);
    }
    for (int i = 0; i < workers.size(); ++i)
        workers[i].join();

    return true;
}

// Called to create a new angle-gradient object
AngleGradient* CreateAngleGradient(const DragGeometry& drag,
                                   COLOR startColor, COLOR endColor,
                                   CYCLE_METHOD cycle, CHANNEL_LAYOUT layout,
                                   const AA_SETTINGS *aa)
{
    AA_SETTINGS settings;

    if (drag.IsClick())
        return 0;  // no gradient for a zero-length drag

    if (cycle != CYCLE_CLAMP && cycle != CYCLE_REFLECT && cycle != CYCLE_REPEAT)
        FatalError("undefined gradient cycle method");

    if (aa != 0)
    {
        if (aa->res < 1 || aa->res > AA_RES_MAXIMUM || !(aa->band >= 0))
            return 0;  // bad AA settings

        settings = *aa;
    }
    return new AngleGrad(drag, startColor, endColor, cycle, layout, settings);
}
