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
// anglegen.h:
//   Header file for the AngleGen angle-gradient fill engine. This
//   header defines the drag geometry, the angle-gradient paint
//   generator, and the utilities for filling a pixel buffer with an
//   angle gradient.
//
//---------------------------------------------------------------------

#ifndef ANGLEGEN_H
  #define ANGLEGEN_H

const double PI = 3.14159265358979323846;

// A 'COLOR' variable contains either a 32-bit pixel, or one or more
// components of a 32-bit pixel. Gradient endpoint colors are in
// 'RGBA32' format (0xaabbggrr). Pixel buffers filled by the
// DrawAngleGradient function are in 'BGRA32' format (0xaarrggbb),
// unless the caller sets the FLAG_SWAP_REDBLUE flag.
typedef unsigned int COLOR;

// Macro definitions
#define RGBX(r,g,b)    (COLOR)(((r)&255)|(((g)&255)<<8)|(((b)&255)<<16)|0xff000000)
#define RGBA(r,g,b,a)  (COLOR)(((r)&255)|(((g)&255)<<8)|(((b)&255)<<16)|((a)<<24))
#define ARRAY_LEN(a)  (sizeof(a)/sizeof((a)[0]))

// Extract the components of an RGBA32 color value
inline int GetRed(COLOR color)   { return color & 0xff; }
inline int GetGreen(COLOR color) { return (color >> 8) & 0xff; }
inline int GetBlue(COLOR color)  { return (color >> 16) & 0xff; }
inline int GetAlpha(COLOR color) { return color >> 24; }

// Rectangles in pixel coordinates
struct AGRect {
    int x;
    int y;
    int w;
    int h;
};

// Points in the continuous (sub-pixel) coordinate space of the raster
struct AGPoint {
    double x;
    double y;
};

// Gradient cycle method: how the gradient behaves over one revolution
enum CYCLE_METHOD
{
    CYCLE_CLAMP,    // one transition per revolution ("No Cycle")
    CYCLE_REFLECT,  // two mirrored half-revolution transitions
    CYCLE_REPEAT,   // two identical half-revolution transitions
};

// Layout of the channel samples produced by a paint generator
enum CHANNEL_LAYOUT
{
    LAYOUT_RGBA,  // 4 bytes per sample, in r,g,b,a order
    LAYOUT_GRAY,  // 1 byte per sample, from the red channel
};

// Supersampling accumulation methods
enum AA_ACCUM
{
    AA_ACCUM_TRUNCATE,  // truncate each sample, integer average
    AA_ACCUM_FLOAT,     // floating-point sum, rounded average
};

// Default anti-aliasing policy near the gradient seams
const double AA_BAND_DEFAULT = 0.2;  // seam band, scaled by 1/distance
const int AA_RES_DEFAULT = 4;        // AA_RES x AA_RES subsamples
const int AA_RES_MAXIMUM = 16;

// Start and end points closer than this are treated as a click
const double DRAG_EPSILON = 1.0e-9;

// Flags for the DrawAngleGradient function
const int FLAG_INVERT = 1;        // swap start and end colors
const int FLAG_SWAP_REDBLUE = 2;  // store pixels as 0xaabbggrr

//---------------------------------------------------------------------
//
// AA_SETTINGS: Tunable anti-aliasing policy for an angle gradient. A
// pixel whose interpolation fraction t lies within band/distance of a
// seam (where distance is the taxicab distance from the drag start)
// is supersampled on a res x res grid. The reflect cycle method has
// no hard seams, so its pixels are never supersampled.
//
//---------------------------------------------------------------------

struct AA_SETTINGS
{
    double band;     // seam band width (default 0.2)
    int res;         // subsamples per pixel edge (default 4)
    AA_ACCUM accum;  // how subsamples are averaged

    AA_SETTINGS() : band(AA_BAND_DEFAULT), res(AA_RES_DEFAULT),
                    accum(AA_ACCUM_TRUNCATE) {}
};

//---------------------------------------------------------------------
//
// DragGeometry class: The start and end points of a drag gesture in
// the target raster's coordinate space. The start point is the center
// of the angle gradient, and the direction from the start point to the
// end point is where the gradient begins (its draw angle). Objects of
// this class are immutable.
//
//---------------------------------------------------------------------

class DragGeometry
{
    AGPoint _start, _end;
    double _drawAngle;  // angle of start-to-end vector, in radians

public:
    DragGeometry(double x0, double y0, double x1, double y1);
    DragGeometry(const AGPoint& start, const AGPoint& end);
    ~DragGeometry() {}
    const AGPoint& GetStart() const { return _start; }
    const AGPoint& GetEnd() const { return _end; }
    double GetDrawAngle() const { return _drawAngle; }
    double GetAngleFromStartTo(double x, double y) const;
    double TaxiCabMetric(double x, double y) const;
    bool IsClick() const;
};

//---------------------------------------------------------------------
//
// ChannelMixer class: Blends the start and end colors of a gradient
// at interpolation fraction t, and writes the unrounded channel values
// to the 'out' array, which has GetChannelCount() elements. The angle
// gradient sampler calls this function once per sample, and is not
// aware of how many channels the target buffer has or where they come
// from. CreateChannelMixer returns the mixer for the specified layout.
//
//---------------------------------------------------------------------

class ChannelMixer
{
public:
    ChannelMixer() {}
    virtual ~ChannelMixer() {}
    virtual int GetChannelCount() const = 0;
    virtual void MixChannels(double t, double out[]) const = 0;
};

ChannelMixer* CreateChannelMixer(CHANNEL_LAYOUT layout, COLOR startColor, COLOR endColor);

//---------------------------------------------------------------------
//
// AngleGradient class: Paint generator for angle gradient fills. The
// FillSpan function generates a span (horizontal row of samples) that
// starts at pixel (xs,ys) and extends to the right for 'len' pixels.
// FillRect fills a rectangle of samples in row-major order, and can
// divide the rows among 'nthreads' worker threads. The output buffer
// must have room for GetChannelCount() bytes per pixel. The Interpolate
// function returns the folded interpolation fraction at point (x,y).
//
//---------------------------------------------------------------------

class AngleGradient
{
public:
    AngleGradient() {}
    virtual ~AngleGradient() {}
    virtual int GetChannelCount() const = 0;
    virtual CYCLE_METHOD GetCycleMethod() const = 0;
    virtual bool IsOpaque() const = 0;
    virtual double Interpolate(double x, double y) const = 0;
    virtual bool NeedsAntialiasing(double x, double y, double t) const = 0;
    virtual bool FillSpan(int xs, int ys, int len, unsigned char outBuf[]) const = 0;
    virtual bool FillRect(const AGRect& rect, unsigned char outBuf[], int nthreads = 1) const = 0;
};

// Called to create a new angle-gradient object. Returns zero if the
// drag is a click (zero length) or the AA settings are not valid.
AngleGradient* CreateAngleGradient(const DragGeometry& drag,
                                   COLOR startColor, COLOR endColor,
                                   CYCLE_METHOD cycle,
                                   CHANNEL_LAYOUT layout = LAYOUT_RGBA,
                                   const AA_SETTINGS *aa = 0);

// Folds a base fraction f in [0,1) through the specified cycle method
double FoldFraction(double f, CYCLE_METHOD cycle);

// Cycle method names, as shown to users ("No Cycle", "Reflect", and
// "Repeat"). The parser also accepts the lowercase short names
// "clamp", "reflect", and "repeat".
const char* GetCycleMethodName(CYCLE_METHOD cycle);
bool ParseCycleMethod(const char *name, CYCLE_METHOD *cycle);

// Reports an internal contract violation and terminates the program
void FatalError(const char *text);

//---------------------------------------------------------------------
//
// The PIXEL_BUFFER struct describes a memory buffer for a 2-D array
// of pixels. A 32-bit buffer (depth = 32) holds BGRA32 pixels, and
// an 8-bit buffer (depth = 8) holds gray levels. The DrawAngleGradient
// function fills the entire buffer with an angle gradient.
//
//---------------------------------------------------------------------

struct PIXEL_BUFFER
{
    void *pixels;  // pointer to 2-D array of pixels
    int width;     // width of pixel buffer in pixels
    int height;    // height of pixel buffer in pixels
    int depth;     // number of bits per pixel (32 or 8)
    int pitch;     // pitch of pixel buffer in bytes
};

// Utilities for manipulating channel buffers
unsigned char* AllocateRawChannels(int w, int h, int nchan, unsigned char fill = 0);
unsigned char* DeleteRawChannels(unsigned char *buf);

// Fills a pixel buffer with an angle gradient. Returns false, and
// leaves the buffer untouched, if the drag is a click.
bool DrawAngleGradient(const PIXEL_BUFFER& pixbuf, const DragGeometry& drag,
                       COLOR startColor, COLOR endColor, CYCLE_METHOD cycle,
                       int flags = 0, int nthreads = 1,
                       const AA_SETTINGS *aa = 0);

//---------------------------------------------------------------------
//
// Generic smart pointer class template: Of course, you might prefer
// to use another smart pointer, such as the unique_ptr class template
// in the C++ Standard Library. However, the template below is used
// here to avoid introducing additional dependencies into the build.
//
//---------------------------------------------------------------------
template <class T> class SmartPtr {
    T* _ptr;
public:
    explicit SmartPtr(T* ptr = 0) { _ptr = ptr; }
    ~SmartPtr() { delete _ptr; }
    T* operator->() { return _ptr; }
    T& operator*() { return *_ptr; }
    T* get() { return _ptr; }
};

#endif  // ANGLEGEN_H
