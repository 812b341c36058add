/*
  Copyright (C) 2019-2022 Jerry R. VanAken

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
// demo.h:
//   Header file for demo code. This header is included by the
//   AngleGen demo frames in demo.cpp, by the BMP file writer, and by
//   the platform-dependent main programs.
//
//---------------------------------------------------------------------

#ifndef DEMO_H
  #define DEMO_H

#include <stdio.h>
#include "anglegen.h"

// Dimensions of window for demo functions
const int DEMO_WIDTH  = 1280;
const int DEMO_HEIGHT =  960;

//---------------------------------------------------------------------
//
// Runs the demo frame specified by 'testnum' (an array index). The
// frame is drawn to the 32-bit back buffer 'bkbuf', inside the device
// clipping rectangle 'cliprect'. Returns the index of the frame that
// was drawn, or -1 if the parameters are bad.
//
//---------------------------------------------------------------------

extern int RunTest(int testnum, const PIXEL_BUFFER& bkbuf, const AGRect& cliprect);

// Returns the number of demo frames
extern int GetTestCount();

//---------------------------------------------------------------------
//
// Class UserMessage: Shows text message to user. Each platform-
// dependent main program supplies its own ShowMessage function.
//
//---------------------------------------------------------------------

const int MESSAGECODE_ERROR = 0;
const int MESSAGECODE_WARNING = 1;
const int MESSAGECODE_INFORMATION = 2;

class UserMessage
{
public:
    UserMessage() {}
    ~UserMessage() {}
    void ShowMessage(const char *text, const char *caption, int msgcode = 0);
};

//---------------------------------------------------------------------
//
// Class BmpWriter:
//   Writes the pixels in a PIXEL_BUFFER to a .bmp file. A 32-bit
//   buffer (BGRA32 pixels) is written as a 32-bit BMP file with an
//   alpha mask, and an 8-bit buffer is written as an 8-bit BMP file
//   with a 256-level gray palette.
//
//---------------------------------------------------------------------

class BmpWriter
{
    UserMessage _umsg;  // shows error message to user

    void ErrorMessage(const char *pszError);

public:
    BmpWriter() {}
    ~BmpWriter() {}
    bool WriteImage(const char *pszFile, const PIXEL_BUFFER& pixbuf);
};

#endif // DEMO_H
