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
// bmpfile.cpp:
//   This file implements a rudimentary BMP file writer; that is, it
//   writes image files with a .bmp filename extension. The writer
//   saves the gradient fills produced by the AngleGen engine, and
//   handles the two pixel buffer formats that the DrawAngleGradient
//   function fills: 32-bit BGRA pixels and 8-bit gray levels.
//
//---------------------------------------------------------------------

#include <stdio.h>
#include <string.h>
#include "demo.h"

//---------------------------------------------------------------------
//
// The following types and structures are defined for .bmp files
//
//---------------------------------------------------------------------
namespace {
    typedef unsigned short WORD;
    typedef unsigned int DWORD;
    typedef int LONG;

    // Values for biCompression field
    const int BI_RGB = 0;
    const int BI_BITFIELDS = 3;

    // Value for biCSType field ('Win ')
    const DWORD LCS_WINDOWS_COLOR_SPACE = 0x57696e20;

    // Make sure that packing alignment setting for structs
    // enables bfSize field to immediately follow bfType
    #pragma pack(push,2)
    struct BITMAPFILEHEADER {
        WORD  bfType;        // bitmap file magic 'BM'
        DWORD bfSize;        // file size (in bytes)
        WORD  bfReserved1;   //
        WORD  bfReserved2;   //
        DWORD bfOffBits;     // byte offset to pixel data
    };
    #pragma pack(pop)

    struct BITMAPINFOHEADER {
        DWORD   biSize;           // size of this header (in bytes)
        LONG    biWidth;          // width of bitmap (in pixels)
        LONG    biHeight;         // height of bitmap (in pixels)
        WORD    biPlanes;         // number of planes (set to 1)
        WORD    biBitCount;       // bits per pixel
        DWORD   biCompression;    // pixel format (BI_RGB, etc.)
        DWORD   biSizeImage;      // size of pixel data (in bytes)
        LONG    biXPelsPerMeter;  // horizontal pixels per meter
        LONG    biYPelsPerMeter;  // vertical pixels per meter
        DWORD   biClrUsed;        // color table, number of colors
        DWORD   biClrImportant;   // color table, important colors
    };

    typedef int FXPT2DOT30;

    struct CIEXYZ {
        FXPT2DOT30 ciexyzX;
        FXPT2DOT30 ciexyzY;
        FXPT2DOT30 ciexyzZ;
    };

    struct CIEXYZTRIPLE {
        CIEXYZ ciexyzRed;
        CIEXYZ ciexyzGreen;
        CIEXYZ ciexyzBlue;
    };

    struct BITMAPV4HEADER {
        DWORD    biSize;
        LONG     biWidth;
        LONG     biHeight;
        WORD     biPlanes;
        WORD     biBitCount;
        DWORD    biCompression;
        DWORD    biSizeImage;
        LONG     biXPelsPerMeter;
        LONG     biYPelsPerMeter;
        DWORD    biClrUsed;
        DWORD    biClrImportant;  // <-- BITMAPINFOHEADER ends here
        DWORD    biRedMask;
        DWORD    biGreenMask;
        DWORD    biBlueMask;
        DWORD    biAlphaMask;
        DWORD    biCSType;
        CIEXYZTRIPLE  biEndpoints;
        DWORD    biGammaRed;
        DWORD    biGammaGreen;
        DWORD    biGammaBlue;
    };

    // 72 dpi, expressed in pixels per meter
    const LONG PELS_PER_METER = 2835;
}

//---------------------------------------------------------------------
//
// BmpWriter class implementation:
//   Writes pixel data from a PIXEL_BUFFER to a BMP file (with a '.bmp'
//   filename extension). The BmpWriter class is defined in demo.h.
//
//   A 32-bit buffer is written with a BITMAPV4HEADER and BI_BITFIELDS
//   masks, so that the alpha channel survives. An 8-bit buffer is
//   written with a BITMAPINFOHEADER followed by a gray palette. Rows
//   are written bottom-up and padded to a multiple of four bytes.
//
//---------------------------------------------------------------------

// Private function: Opens message box to notify user of error
void BmpWriter::ErrorMessage(const char *pszError)
{
    _umsg.ShowMessage(pszError, "BMP file writer - Error", MESSAGECODE_ERROR);
}

// Public function: Writes the image in 'pixbuf' to the file named by
// 'pszFile'. Returns true if the entire file was written.
bool BmpWriter::WriteImage(const char *pszFile, const PIXEL_BUFFER& pixbuf)
{
    const char *pszError = 0;
    FILE *pFile = 0;

    if (pszFile == 0 || pszFile[0] == '\0')
    {
        ErrorMessage("No file name was specified");
        return false;
    }
    for (int i = 1; i > 0; --i)  // hack to avoid nested if-statements
    {
        if (pixbuf.pixels == 0 || pixbuf.width <= 0 || pixbuf.height <= 0)
        {
            pszError = "cannot be written from an empty pixel buffer";
            break;
        }
        if (pixbuf.depth != 32 && pixbuf.depth != 8)
        {
            pszError = "cannot be written from this pixel format";
            break;
        }
        pFile = fopen(pszFile, "wb");
        if (pFile == 0)
        {
            pszError = "cannot be opened for writing";
            break;
        }

        int bpp = pixbuf.depth;
        int rowbytes = pixbuf.width*(bpp >> 3);
        int stride = ((((pixbuf.width * bpp) + 31) & ~31) >> 3);
        int pad = stride - rowbytes;
        int infoSize = (bpp == 32) ? sizeof(BITMAPV4HEADER) : sizeof(BITMAPINFOHEADER);
        int paletteSize = (bpp == 8) ? 256*sizeof(DWORD) : 0;
        BITMAPFILEHEADER hdr;
        BITMAPV4HEADER info;

        memset(&hdr, 0, sizeof(hdr));
        memset(&info, 0, sizeof(info));
        memcpy(&hdr.bfType, "BM", 2);
        hdr.bfOffBits = sizeof(hdr) + infoSize + paletteSize;
        hdr.bfSize = hdr.bfOffBits + stride*pixbuf.height;
        info.biSize = infoSize;
        info.biWidth = pixbuf.width;
        info.biHeight = pixbuf.height;  // bottom-up
        info.biPlanes = 1;
        info.biBitCount = bpp;
        info.biSizeImage = stride*pixbuf.height;
        info.biXPelsPerMeter = info.biYPelsPerMeter = PELS_PER_METER;
        if (bpp == 32)
        {
            info.biCompression = BI_BITFIELDS;
            info.biRedMask   = 0x00ff0000;
            info.biGreenMask = 0x0000ff00;
            info.biBlueMask  = 0x000000ff;
            info.biAlphaMask = 0xff000000;
            info.biCSType = LCS_WINDOWS_COLOR_SPACE;
        }
        else
        {
            info.biCompression = BI_RGB;
            info.biClrUsed = info.biClrImportant = 256;
        }
        if (fwrite(&hdr, sizeof(hdr), 1, pFile) < 1 ||
            fwrite(&info, infoSize, 1, pFile) < 1)
        {
            pszError = "cannot be written (header)";
            break;
        }

        // An 8-bit image needs a palette that maps each gray level
        // to itself
        if (bpp == 8)
        {
            DWORD palette[256];

            for (int k = 0; k < 256; ++k)
                palette[k] = (k << 16) | (k << 8) | k;

            if (fwrite(palette, sizeof(palette), 1, pFile) < 1)
            {
                pszError = "cannot be written (palette)";
                break;
            }
        }

        // Write the rows, starting with the bottom row
        const char zeros[4] = { 0 };
        const unsigned char *pixels = static_cast<const unsigned char*>(pixbuf.pixels);

        for (int row = pixbuf.height - 1; row >= 0; --row)
        {
            const unsigned char *prow = &pixels[row*pixbuf.pitch];

            if (fwrite(prow, rowbytes, 1, pFile) < 1 ||
                (pad > 0 && fwrite(zeros, pad, 1, pFile) < 1))
            {
                pszError = "cannot be written (pixel data)";
                break;
            }
        }
    }
    if (pFile && fclose(pFile) != 0 && pszError == 0)
        pszError = "cannot be closed";

    if (pszError)
    {
        char sbuf[256];
        const char *pszFormat = "File \"%s\" %s";

        if (strlen(pszFile) < sizeof(sbuf) - strlen(pszFormat) - strlen(pszError))
        {
            sprintf(sbuf, pszFormat, pszFile, pszError);
            ErrorMessage(sbuf);
        }
        else
            ErrorMessage("File name is too long");

        return false;
    }
    return true;
}
