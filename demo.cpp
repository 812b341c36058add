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
// demo.cpp:
//   Demo frames for the AngleGen angle-gradient fill engine. Each
//   frame fills the device clipping rectangle of a 32-bit back buffer
//   with one or more angle gradients.
//
//---------------------------------------------------------------------

#include <math.h>
#include <stdio.h>
#include <string.h>
#include "demo.h"

// Number of worker threads used to fill each frame
const int DEMO_THREADS = 4;

//---------------------------------------------------------------------
//
// These utility functions are handy for dividing the back buffer into
// panels and for drawing gray-level gradients
//
//---------------------------------------------------------------------

// Given a PIXEL_BUFFER structure 'bigbuf' that describes a pixel
// buffer, and a bounding box 'bbox' that specifies a rectangular
// subregion in the buffer, this function writes a description of the
// subregion to the PIXEL_BUFFER structure 'subbuf', overwriting its
// original contents. The 'pixels' member of the 'subbuf' structure
// is set to the memory address of the pixel at the top-left corner
// of the subregion (do not try to delete this memory!). The function
// returns true if the subregion fits within the bounds of 'bigbuf'.
bool DefineSubregion(PIXEL_BUFFER& subbuf, const PIXEL_BUFFER& bigbuf, const AGRect& bbox)
{
    int xmax = bbox.x + bbox.w;
    int ymax = bbox.y + bbox.h;
    bool retval = bbox.x >= 0 && bbox.y >= 0 &&
                  xmax <= bigbuf.width && ymax <= bigbuf.height;

    subbuf.width = bbox.w;
    subbuf.height = bbox.h;
    subbuf.pitch = bigbuf.pitch;
    subbuf.depth = bigbuf.depth;
    if (bigbuf.pixels && retval)
    {
        unsigned char *p = static_cast<unsigned char*>(bigbuf.pixels);
        subbuf.pixels = &p[bbox.y*bigbuf.pitch + bbox.x*(bigbuf.depth >> 3)];
    }
    else
        subbuf.pixels = 0;

    return retval;
}

// Fills a 32-bit buffer with a gray-level angle gradient. The gradient
// is drawn to an 8-bit buffer, and each gray level g is then expanded
// to the opaque BGRA32 pixel 0xffgggggg.
bool DrawGrayGradient(const PIXEL_BUFFER& bkbuf, const DragGeometry& drag,
                      COLOR startColor, COLOR endColor, CYCLE_METHOD cycle, int flags)
{
    unsigned char *gray = AllocateRawChannels(bkbuf.width, bkbuf.height, 1);
    PIXEL_BUFFER graybuf;

    if (gray == 0)
        return false;

    graybuf.pixels = gray;
    graybuf.width = bkbuf.width;
    graybuf.height = bkbuf.height;
    graybuf.depth = 8;
    graybuf.pitch = bkbuf.width;
    if (!DrawAngleGradient(graybuf, drag, startColor, endColor, cycle,
                           flags, DEMO_THREADS))
    {
        DeleteRawChannels(gray);
        return false;
    }

    unsigned char *prow = static_cast<unsigned char*>(bkbuf.pixels);
    const unsigned char *src = gray;
    for (int j = 0; j < bkbuf.height; ++j)
    {
        COLOR *pixel = reinterpret_cast<COLOR*>(prow);
        for (int i = 0; i < bkbuf.width; ++i)
        {
            COLOR g = *src++;
            *pixel++ = 0xff000000 | (g << 16) | (g << 8) | g;
        }
        prow += bkbuf.pitch;
    }
    DeleteRawChannels(gray);
    return true;
}

// Returns a drag that starts at the center of a w x h frame and
// points in the direction 'angle' (in degrees, clockwise from +x)
DragGeometry CenterDrag(int w, int h, float angle)
{
    double x0 = w/2.0, y0 = h/2.0;
    double len = (w < h ? w : h)/4.0;
    double phi = angle*PI/180;

    return DragGeometry(x0, y0, x0 + len*cos(phi), y0 + len*sin(phi));
}

//---------------------------------------------------------------------
//
// Demo frames
//
//---------------------------------------------------------------------

// No cycle: a single red-to-blue transition with one hard seam
void demo01(const PIXEL_BUFFER& bkbuf)
{
    DragGeometry drag = CenterDrag(bkbuf.width, bkbuf.height, 0);

    DrawAngleGradient(bkbuf, drag, RGBX(220,30,30), RGBX(30,60,220),
                      CYCLE_CLAMP, 0, DEMO_THREADS);
}

// Reflect: two mirrored transitions, with no hard seams
void demo02(const PIXEL_BUFFER& bkbuf)
{
    DragGeometry drag = CenterDrag(bkbuf.width, bkbuf.height, 30);

    DrawAngleGradient(bkbuf, drag, RGBX(250,220,40), RGBX(20,120,60),
                      CYCLE_REFLECT, 0, DEMO_THREADS);
}

// Repeat: two identical transitions, with two hard seams
void demo03(const PIXEL_BUFFER& bkbuf)
{
    DragGeometry drag = CenterDrag(bkbuf.width, bkbuf.height, -45);

    DrawAngleGradient(bkbuf, drag, RGBX(0,0,0), RGBX(255,255,255),
                      CYCLE_REPEAT, 0, DEMO_THREADS);
}

// Inverted repeat from an off-center start point
void demo04(const PIXEL_BUFFER& bkbuf)
{
    DragGeometry drag(bkbuf.width/4.0, bkbuf.height/3.0,
                      bkbuf.width/2.0, bkbuf.height/2.0);

    DrawAngleGradient(bkbuf, drag, RGBX(255,128,0), RGBX(40,0,90),
                      CYCLE_REPEAT, FLAG_INVERT, DEMO_THREADS);
}

// Gray levels from the red channels of the two colors
void demo05(const PIXEL_BUFFER& bkbuf)
{
    DragGeometry drag = CenterDrag(bkbuf.width, bkbuf.height, 90);

    DrawGrayGradient(bkbuf, drag, RGBX(16,0,0), RGBX(240,0,0), CYCLE_CLAMP, 0);
}

// Four panels: no cycle, reflect, repeat, and gray repeat
void demo06(const PIXEL_BUFFER& bkbuf)
{
    const CYCLE_METHOD cycle[] = { CYCLE_CLAMP, CYCLE_REFLECT, CYCLE_REPEAT, CYCLE_REPEAT };
    int w = bkbuf.width/2, h = bkbuf.height/2;

    if (w <= 0 || h <= 0)
        return;

    for (int i = 0; i < ARRAY_LEN(cycle); ++i)
    {
        AGRect bbox = { (i & 1)*w, (i >> 1)*h, w, h };
        PIXEL_BUFFER panel;
        DragGeometry drag = CenterDrag(w, h, 60.0f*i);

        if (!DefineSubregion(panel, bkbuf, bbox))
            continue;

        if (i < 3)
            DrawAngleGradient(panel, drag, RGBX(255,255,255), RGBX(200,20,120),
                              cycle[i], 0, DEMO_THREADS);
        else
            DrawGrayGradient(panel, drag, RGBX(255,0,0), RGBX(0,0,0), cycle[i], 0);
    }
}

// Fine-grained seams: a drag of one pixel, with floating-point
// accumulation and 8 x 8 supersampling
void demo07(const PIXEL_BUFFER& bkbuf)
{
    AA_SETTINGS aa;
    double x0 = bkbuf.width/2.0, y0 = bkbuf.height/2.0;
    DragGeometry drag(x0, y0, x0 + 1.0, y0 + 1.0);

    aa.res = 8;
    aa.band = 0.5;
    aa.accum = AA_ACCUM_FLOAT;
    DrawAngleGradient(bkbuf, drag, RGBA(0,90,200,255), RGBA(0,90,200,0),
                      CYCLE_REPEAT, 0, DEMO_THREADS, &aa);
}

// Array of pointers to all demo functions
void (*testfunc[])(const PIXEL_BUFFER& bkbuf) =
{
    demo01, demo02, demo03, demo04,
    demo05, demo06, demo07,
};

int GetTestCount()
{
    return ARRAY_LEN(testfunc);
}

//---------------------------------------------------------------------
//
// The main program calls this function to run the demos
//
//---------------------------------------------------------------------

int RunTest(int testnum, const PIXEL_BUFFER& bkbuf, const AGRect& cliprect)
{
    const int len = ARRAY_LEN(testfunc);

    if (bkbuf.depth != 32 || bkbuf.pixels == 0 ||
        cliprect.w > bkbuf.width || cliprect.h > bkbuf.height)
    {
        return -1;  // configuration error
    }

    // Intersect the clipping rectangle with the back buffer
    int xmin = (cliprect.x > 0) ? cliprect.x : 0;
    int ymin = (cliprect.y > 0) ? cliprect.y : 0;
    int xmax = cliprect.x + cliprect.w;
    int ymax = cliprect.y + cliprect.h;

    if (xmax > bkbuf.width)
        xmax = bkbuf.width;
    if (ymax > bkbuf.height)
        ymax = bkbuf.height;

    testnum = (testnum % len + len) % len;
    if (xmax > xmin && ymax > ymin)
    {
        AGRect bbox = { xmin, ymin, xmax - xmin, ymax - ymin };
        PIXEL_BUFFER framebuf;

        DefineSubregion(framebuf, bkbuf, bbox);
        testfunc[testnum](framebuf);
    }
    return testnum;
}
