//---------------------------------------------------------------------
//
//  climain.cpp:
//    This file contains the main program for agfill, a command-line
//    tool that fills an image with an angle gradient (or with one of
//    the demo frames) and saves the image as a .bmp file. Usage:
//
//      agfill [options] output.bmp
//
//        -s x,y    drag start point (default: image center)
//        -e x,y    drag end point (default: right of start point)
//        -c name   cycle method: clamp, reflect, repeat, "No Cycle"
//        -a color  start color, as 0xAARRGGBB (default: 0xff000000)
//        -b color  end color, as 0xAARRGGBB (default: 0xffffffff)
//        -i        invert (swap start and end colors)
//        -g        gray levels (8-bit image from the red channels)
//        -w width  image width (default: 640)
//        -h height image height (default: 480)
//        -t count  number of worker threads (default: 1)
//        -r res    supersampling grid resolution (default: 4)
//        -f        floating-point supersample accumulation
//        -d frame  draw demo frame number 'frame' instead
//
//---------------------------------------------------------------------

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include "demo.h"

// Display error/warning/info text message for user
void UserMessage::ShowMessage(const char *text, const char *caption, int msgcode)
{
    if (msgcode == MESSAGECODE_INFORMATION)
        printf("%s: %s\n", caption, text);
    else
        fprintf(stderr, "%s%s: %s\n",
                (msgcode == MESSAGECODE_WARNING) ? "WARNING-- " : "ERROR-- ",
                caption, text);
}

namespace {
    // Default image dimensions
    const int IMAGE_WIDTH = 640;
    const int IMAGE_HEIGHT = 480;
    const int IMAGE_MAXSIZE = 16384;
    const int MAX_THREADS = 64;

    struct OPTIONS
    {
        AGPoint start, end;
        bool bStart, bEnd;
        CYCLE_METHOD cycle;
        COLOR startColor, endColor;
        int flags;
        bool bGray;
        int width, height;
        int nthreads;
        int demo;  // demo frame number, or -1
        AA_SETTINGS aa;
        const char *pszFile;
    };

    void Usage()
    {
        fprintf(stderr,
            "Usage: agfill [options] output.bmp\n"
            "  -s x,y     drag start point (default: image center)\n"
            "  -e x,y     drag end point (default: right of start point)\n"
            "  -c name    cycle method: clamp, reflect, repeat\n"
            "  -a color   start color, as 0xAARRGGBB\n"
            "  -b color   end color, as 0xAARRGGBB\n"
            "  -i         invert (swap start and end colors)\n"
            "  -g         gray levels (8-bit image)\n"
            "  -w width   image width\n"
            "  -h height  image height\n"
            "  -t count   number of worker threads\n"
            "  -r res     supersampling grid resolution\n"
            "  -f         floating-point supersample accumulation\n"
            "  -d frame   draw demo frame instead\n");
    }

    bool ParsePoint(const char *arg, AGPoint *pt)
    {
        char *end = 0;

        pt->x = strtod(arg, &end);
        if (end == arg || *end != ',')
            return false;

        arg = end + 1;
        pt->y = strtod(arg, &end);
        return end != arg && *end == '\0';
    }

    bool ParseInt(const char *arg, int lo, int hi, int *value)
    {
        char *end = 0;
        long n = strtol(arg, &end, 0);

        if (end == arg || *end != '\0' || n < lo || n > hi)
            return false;

        *value = n;
        return true;
    }

    // Converts a color from the 0xAARRGGBB notation used on the
    // command line to the RGBA32 format (0xaabbggrr)
    bool ParseColor(const char *arg, COLOR *color)
    {
        char *end = 0;
        unsigned long argb = strtoul(arg, &end, 16);

        if (end == arg || *end != '\0' || argb > 0xffffffffUL)
            return false;

        *color = RGBA((argb >> 16) & 255, (argb >> 8) & 255, argb & 255,
                      (argb >> 24) & 255);
        return true;
    }

    // Returns false if the command line has an error
    bool ParseArgs(int argc, char *argv[], OPTIONS *opt)
    {
        opt->bStart = opt->bEnd = false;
        opt->cycle = CYCLE_CLAMP;
        opt->startColor = RGBX(0,0,0);
        opt->endColor = RGBX(255,255,255);
        opt->flags = 0;
        opt->bGray = false;
        opt->width = IMAGE_WIDTH;
        opt->height = IMAGE_HEIGHT;
        opt->nthreads = 1;
        opt->demo = -1;
        opt->pszFile = 0;

        for (int i = 1; i < argc; ++i)
        {
            const char *arg = argv[i];

            if (arg[0] != '-' || arg[1] == '\0' || arg[2] != '\0')
            {
                if (opt->pszFile != 0)
                {
                    fprintf(stderr, "ERROR-- Unexpected argument \"%s\"\n", arg);
                    return false;
                }
                opt->pszFile = arg;
                continue;
            }

            // Switches without a value
            switch (arg[1])
            {
            case 'i':
                opt->flags |= FLAG_INVERT;
                continue;
            case 'g':
                opt->bGray = true;
                continue;
            case 'f':
                opt->aa.accum = AA_ACCUM_FLOAT;
                continue;
            default:
                break;
            }

            // Switches that take a value
            if (i + 1 >= argc)
            {
                fprintf(stderr, "ERROR-- Option %s needs a value\n", arg);
                return false;
            }
            const char *val = argv[++i];
            bool ok = false;

            switch (arg[1])
            {
            case 's':
                ok = opt->bStart = ParsePoint(val, &opt->start);
                break;
            case 'e':
                ok = opt->bEnd = ParsePoint(val, &opt->end);
                break;
            case 'c':
                ok = ParseCycleMethod(val, &opt->cycle);
                break;
            case 'a':
                ok = ParseColor(val, &opt->startColor);
                break;
            case 'b':
                ok = ParseColor(val, &opt->endColor);
                break;
            case 'w':
                ok = ParseInt(val, 1, IMAGE_MAXSIZE, &opt->width);
                break;
            case 'h':
                ok = ParseInt(val, 1, IMAGE_MAXSIZE, &opt->height);
                break;
            case 't':
                ok = ParseInt(val, 1, MAX_THREADS, &opt->nthreads);
                break;
            case 'r':
                ok = ParseInt(val, 1, AA_RES_MAXIMUM, &opt->aa.res);
                break;
            case 'd':
                ok = ParseInt(val, 0, GetTestCount() - 1, &opt->demo);
                break;
            default:
                fprintf(stderr, "ERROR-- Unknown option %s\n", arg);
                return false;
            }
            if (!ok)
            {
                fprintf(stderr, "ERROR-- Bad value \"%s\" for option %s\n", val, arg);
                return false;
            }
        }
        if (opt->pszFile == 0)
        {
            fprintf(stderr, "ERROR-- No output file was specified\n");
            return false;
        }
        if (opt->demo >= 0 && opt->bGray)
        {
            fprintf(stderr, "ERROR-- Demo frames cannot be drawn as gray levels\n");
            return false;
        }
        if (!opt->bStart)
        {
            opt->start.x = opt->width/2.0;
            opt->start.y = opt->height/2.0;
        }
        if (!opt->bEnd)
        {
            opt->end.x = opt->start.x + opt->width/4.0;
            opt->end.y = opt->start.y;
        }
        return true;
    }
}

//---------------------------------------------------------------------
//
// Command-line main function
//
//---------------------------------------------------------------------

int main(int argc, char *argv[])
{
    OPTIONS opt;
    UserMessage umsg;
    BmpWriter writer;

    if (!ParseArgs(argc, argv, &opt))
    {
        Usage();
        return 1;
    }

    int nchan = opt.bGray ? 1 : 4;
    unsigned char *pixels = AllocateRawChannels(opt.width, opt.height, nchan, 0xff);
    PIXEL_BUFFER pixbuf;

    pixbuf.pixels = pixels;
    pixbuf.width = opt.width;
    pixbuf.height = opt.height;
    pixbuf.depth = 8*nchan;
    pixbuf.pitch = opt.width*nchan;
    if (opt.demo >= 0)
    {
        AGRect cliprect = { 0, 0, opt.width, opt.height };

        printf("Drawing demo frame %d...\n", opt.demo);
        RunTest(opt.demo, pixbuf, cliprect);
    }
    else
    {
        DragGeometry drag(opt.start, opt.end);

        printf("Drawing %s angle gradient (%d x %d)...\n",
               GetCycleMethodName(opt.cycle), opt.width, opt.height);
        if (drag.IsClick())
        {
            umsg.ShowMessage("Start and end points are the same; nothing to draw",
                             "agfill", MESSAGECODE_WARNING);
        }
        else if (!DrawAngleGradient(pixbuf, drag, opt.startColor, opt.endColor,
                                    opt.cycle, opt.flags, opt.nthreads, &opt.aa))
        {
            umsg.ShowMessage("Gradient could not be drawn", "agfill", MESSAGECODE_ERROR);
            DeleteRawChannels(pixels);
            return 2;
        }
    }

    bool ok = writer.WriteImage(opt.pszFile, pixbuf);
    DeleteRawChannels(pixels);
    if (!ok)
        return 2;

    printf("Wrote %s\n", opt.pszFile);
    return 0;
}
