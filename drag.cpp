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
// drag.cpp:
//   Implementation of the DragGeometry class, which describes the
//   start and end points of a drag gesture and measures angles and
//   distances relative to the start point
//
//---------------------------------------------------------------------

#include <math.h>
#include "anglegen.h"

DragGeometry::DragGeometry(double x0, double y0, double x1, double y1)
{
    _start.x = x0, _start.y = y0;
    _end.x = x1, _end.y = y1;
    _drawAngle = atan2(y1 - y0, x1 - x0);
}

DragGeometry::DragGeometry(const AGPoint& start, const AGPoint& end) :
                _start(start), _end(end)
{
    _drawAngle = atan2(end.y - start.y, end.x - start.x);
}

// Returns the angle, in radians, of the vector from the start point
// to point (x,y). The angle is in the range -PI to +PI.
double DragGeometry::GetAngleFromStartTo(double x, double y) const
{
    return atan2(y - _start.y, x - _start.x);
}

// Returns the taxicab distance from the start point to point (x,y),
// but never less than 1. The caller divides by this value.
double DragGeometry::TaxiCabMetric(double x, double y) const
{
    double dist = fabs(x - _start.x) + fabs(y - _start.y);

    return (dist < 1.0) ? 1.0 : dist;
}

// Returns true if the drag has zero length, in which case no
// gradient can be drawn
bool DragGeometry::IsClick() const
{
    return fabs(_end.x - _start.x) < DRAG_EPSILON &&
           fabs(_end.y - _start.y) < DRAG_EPSILON;
}
