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
// test_gradient.cpp:
//   Unit tests for the angle-gradient paint generator, the cycle
//   method folding, and the channel mixers
//
//---------------------------------------------------------------------

#include <math.h>
#include <stdlib.h>
#include <string.h>
#include <vector>
#include <gtest/gtest.h>
#include "anglegen.h"

namespace {
    const CYCLE_METHOD allCycles[] = { CYCLE_CLAMP, CYCLE_REFLECT, CYCLE_REPEAT };

    const COLOR black = RGBA(0,0,0,255);
    const COLOR white = RGBA(255,255,255,255);

    // Channel value of one (unaveraged) sample at fraction t
    int BlendChannel(int start, int end, double t)
    {
        return int(start + t*(end - start));
    }

    std::vector<unsigned char> FillAll(const AngleGradient *grad, const AGRect& rect,
                                       int nthreads = 1)
    {
        std::vector<unsigned char> buf(rect.w*rect.h*grad->GetChannelCount(), 0);
        grad->FillRect(rect, &buf[0], nthreads);
        return buf;
    }
}

//---------------------------------------------------------------------
//
// Cycle method folding
//
//---------------------------------------------------------------------

TEST(FoldFraction, ClampPassesFractionThrough)
{
    for (int k = 0; k < 64; ++k)
        EXPECT_DOUBLE_EQ(k/64.0, FoldFraction(k/64.0, CYCLE_CLAMP));
}

TEST(FoldFraction, ReflectIsSymmetricAboutMidpoint)
{
    for (int k = 0; k < 64; ++k)
    {
        double f = k/64.0 + 0.003;
        EXPECT_NEAR(FoldFraction(f, CYCLE_REFLECT),
                    FoldFraction(1.0 - f, CYCLE_REFLECT), 1e-12) << "f = " << f;
    }
    EXPECT_DOUBLE_EQ(FoldFraction(0.0, CYCLE_REFLECT), FoldFraction(1.0, CYCLE_REFLECT));
    EXPECT_DOUBLE_EQ(1.0, FoldFraction(0.5, CYCLE_REFLECT));
    EXPECT_DOUBLE_EQ(0.5, FoldFraction(0.25, CYCLE_REFLECT));
    EXPECT_DOUBLE_EQ(0.5, FoldFraction(0.75, CYCLE_REFLECT));
}

TEST(FoldFraction, RepeatHasTwoIdenticalHalfCycles)
{
    for (int k = 0; k < 64; ++k)
    {
        double f = k/64.0 + 0.001;
        EXPECT_NEAR(FoldFraction(f, CYCLE_REPEAT),
                    FoldFraction(fmod(f + 0.5, 1.0), CYCLE_REPEAT), 1e-12) << "f = " << f;
    }
    EXPECT_DOUBLE_EQ(0.0, FoldFraction(0.5, CYCLE_REPEAT));
    EXPECT_DOUBLE_EQ(0.5, FoldFraction(0.75, CYCLE_REPEAT));
}

TEST(FoldFraction, SeamAtOneFoldsLikeZero)
{
    for (int i = 0; i < ARRAY_LEN(allCycles); ++i)
    {
        CYCLE_METHOD cycle = allCycles[i];
        EXPECT_DOUBLE_EQ(FoldFraction(0.0, cycle), FoldFraction(1.0, cycle));
        EXPECT_DOUBLE_EQ(FoldFraction(0.0, cycle), FoldFraction(2.0, cycle));
        EXPECT_DOUBLE_EQ(FoldFraction(0.0, cycle), FoldFraction(-1e-18, cycle));
        EXPECT_NEAR(FoldFraction(0.25, cycle), FoldFraction(1.25, cycle), 1e-12);
    }
}

TEST(FoldFraction, ReflectIsContinuousAcrossSeam)
{
    double below = FoldFraction(1.0 - 1e-9, CYCLE_REFLECT);
    double above = FoldFraction(1e-9, CYCLE_REFLECT);

    EXPECT_NEAR(below, above, 1e-8);
    EXPECT_NEAR(0.0, above, 1e-8);
}

TEST(FoldFraction, ResultStaysInUnitInterval)
{
    for (int i = 0; i < ARRAY_LEN(allCycles); ++i)
    {
        for (int k = 0; k <= 1000; ++k)
        {
            double t = FoldFraction(k/1000.0, allCycles[i]);
            EXPECT_GE(t, 0.0);
            EXPECT_LE(t, 1.0);
        }
    }
}

TEST(FoldFractionDeathTest, UndefinedCycleMethodFailsFast)
{
    EXPECT_DEATH(FoldFraction(0.3, CYCLE_METHOD(3)), "undefined gradient cycle method");
}

//---------------------------------------------------------------------
//
// Cycle method names
//
//---------------------------------------------------------------------

TEST(CycleMethodName, DisplayNames)
{
    EXPECT_STREQ("No Cycle", GetCycleMethodName(CYCLE_CLAMP));
    EXPECT_STREQ("Reflect", GetCycleMethodName(CYCLE_REFLECT));
    EXPECT_STREQ("Repeat", GetCycleMethodName(CYCLE_REPEAT));
}

TEST(CycleMethodName, ParseAcceptsDisplayAndShortNames)
{
    CYCLE_METHOD cycle = CYCLE_REPEAT;

    EXPECT_TRUE(ParseCycleMethod("No Cycle", &cycle));
    EXPECT_EQ(CYCLE_CLAMP, cycle);
    EXPECT_TRUE(ParseCycleMethod("reflect", &cycle));
    EXPECT_EQ(CYCLE_REFLECT, cycle);
    EXPECT_TRUE(ParseCycleMethod("Repeat", &cycle));
    EXPECT_EQ(CYCLE_REPEAT, cycle);
    EXPECT_TRUE(ParseCycleMethod("clamp", &cycle));
    EXPECT_EQ(CYCLE_CLAMP, cycle);
}

TEST(CycleMethodName, ParseRejectsUnknownNames)
{
    CYCLE_METHOD cycle = CYCLE_REFLECT;

    EXPECT_FALSE(ParseCycleMethod("Mirror", &cycle));
    EXPECT_FALSE(ParseCycleMethod("", &cycle));
    EXPECT_FALSE(ParseCycleMethod("REPEAT", &cycle));
    EXPECT_EQ(CYCLE_REFLECT, cycle);
}

TEST(CycleMethodNameDeathTest, UndefinedCycleMethodFailsFast)
{
    EXPECT_DEATH(GetCycleMethodName(CYCLE_METHOD(3)), "undefined gradient cycle method");
}

//---------------------------------------------------------------------
//
// Channel mixers
//
//---------------------------------------------------------------------

TEST(ChannelMixer, RgbaMixerBlendsAllFourChannels)
{
    SmartPtr<ChannelMixer> mixer(CreateChannelMixer(LAYOUT_RGBA, RGBA(10,20,30,40),
                                                    RGBA(110,220,0,240)));
    double out[4];

    ASSERT_EQ(4, mixer->GetChannelCount());
    mixer->MixChannels(0.5, out);
    EXPECT_DOUBLE_EQ(60.0, out[0]);
    EXPECT_DOUBLE_EQ(120.0, out[1]);
    EXPECT_DOUBLE_EQ(15.0, out[2]);
    EXPECT_DOUBLE_EQ(140.0, out[3]);
}

TEST(ChannelMixer, GrayMixerUsesRedChannel)
{
    SmartPtr<ChannelMixer> mixer(CreateChannelMixer(LAYOUT_GRAY, RGBA(20,200,200,0),
                                                    RGBA(220,0,0,255)));
    double out[1];

    ASSERT_EQ(1, mixer->GetChannelCount());
    mixer->MixChannels(0.0, out);
    EXPECT_DOUBLE_EQ(20.0, out[0]);
    mixer->MixChannels(0.25, out);
    EXPECT_DOUBLE_EQ(70.0, out[0]);
    mixer->MixChannels(1.0, out);
    EXPECT_DOUBLE_EQ(220.0, out[0]);
}

//---------------------------------------------------------------------
//
// AngleGradient paint generator
//
//---------------------------------------------------------------------

TEST(AngleGradient, ClickHasNoGradient)
{
    DragGeometry drag(5, 5, 5, 5);

    for (int i = 0; i < ARRAY_LEN(allCycles); ++i)
        EXPECT_TRUE(CreateAngleGradient(drag, black, white, allCycles[i]) == 0);
}

TEST(AngleGradient, BadAntialiasingSettingsAreRejected)
{
    DragGeometry drag(0, 0, 10, 0);
    AA_SETTINGS aa;

    aa.res = 0;
    EXPECT_TRUE(CreateAngleGradient(drag, black, white, CYCLE_CLAMP, LAYOUT_RGBA, &aa) == 0);
    aa.res = AA_RES_MAXIMUM + 1;
    EXPECT_TRUE(CreateAngleGradient(drag, black, white, CYCLE_CLAMP, LAYOUT_RGBA, &aa) == 0);
    aa.res = AA_RES_DEFAULT;
    aa.band = -0.1;
    EXPECT_TRUE(CreateAngleGradient(drag, black, white, CYCLE_CLAMP, LAYOUT_RGBA, &aa) == 0);
}

TEST(AngleGradientDeathTest, UndefinedCycleMethodFailsFast)
{
    DragGeometry drag(0, 0, 10, 0);

    EXPECT_DEATH(CreateAngleGradient(drag, black, white, CYCLE_METHOD(3)),
                 "undefined gradient cycle method");
}

TEST(AngleGradient, ChannelCountFollowsLayout)
{
    DragGeometry drag(0, 0, 10, 0);
    SmartPtr<AngleGradient> rgba(CreateAngleGradient(drag, black, white, CYCLE_CLAMP, LAYOUT_RGBA));
    SmartPtr<AngleGradient> gray(CreateAngleGradient(drag, black, white, CYCLE_CLAMP, LAYOUT_GRAY));

    ASSERT_TRUE(rgba.get() != 0);
    ASSERT_TRUE(gray.get() != 0);
    EXPECT_EQ(4, rgba->GetChannelCount());
    EXPECT_EQ(1, gray->GetChannelCount());
    EXPECT_EQ(CYCLE_CLAMP, rgba->GetCycleMethod());
}

TEST(AngleGradient, OpaqueOnlyIfBothColorsAreOpaque)
{
    DragGeometry drag(0, 0, 10, 0);
    SmartPtr<AngleGradient> a(CreateAngleGradient(drag, black, white, CYCLE_CLAMP));
    SmartPtr<AngleGradient> b(CreateAngleGradient(drag, black, RGBA(255,255,255,254), CYCLE_CLAMP));
    SmartPtr<AngleGradient> c(CreateAngleGradient(drag, RGBA(0,0,0,0), white, CYCLE_REPEAT));

    EXPECT_TRUE(a->IsOpaque());
    EXPECT_FALSE(b->IsOpaque());
    EXPECT_FALSE(c->IsOpaque());
}

TEST(AngleGradient, InterpolateMeasuresAngleFromDrawAngle)
{
    DragGeometry drag(0, 0, 10, 0);
    SmartPtr<AngleGradient> clamp(CreateAngleGradient(drag, black, white, CYCLE_CLAMP));
    SmartPtr<AngleGradient> repeat(CreateAngleGradient(drag, black, white, CYCLE_REPEAT));

    EXPECT_DOUBLE_EQ(0.0, clamp->Interpolate(20, 0));
    EXPECT_DOUBLE_EQ(0.25, clamp->Interpolate(0, 20));
    EXPECT_DOUBLE_EQ(0.5, clamp->Interpolate(-10, 0));
    EXPECT_DOUBLE_EQ(0.75, clamp->Interpolate(0, -20));
    EXPECT_DOUBLE_EQ(0.5, repeat->Interpolate(0, 20));
    EXPECT_DOUBLE_EQ(0.0, repeat->Interpolate(-10, 0));
}

TEST(AngleGradient, InterpolateIsRelativeToDragDirection)
{
    DragGeometry drag(50, 50, 50, 80);  // points down (+y)
    SmartPtr<AngleGradient> clamp(CreateAngleGradient(drag, black, white, CYCLE_CLAMP));

    EXPECT_DOUBLE_EQ(0.0, clamp->Interpolate(50, 100));
    EXPECT_DOUBLE_EQ(0.25, clamp->Interpolate(20, 50));
    EXPECT_DOUBLE_EQ(0.5, clamp->Interpolate(50, 10));
    EXPECT_DOUBLE_EQ(0.75, clamp->Interpolate(90, 50));
}

TEST(AngleGradient, InterpolateStaysInUnitInterval)
{
    DragGeometry drag(3.3, -1.7, -20, 9);

    for (int i = 0; i < ARRAY_LEN(allCycles); ++i)
    {
        SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, black, white, allCycles[i]));
        for (int y = -20; y <= 20; ++y)
        {
            for (int x = -20; x <= 20; ++x)
            {
                double t = grad->Interpolate(x*0.75, y*0.75);
                EXPECT_GE(t, 0.0);
                EXPECT_LE(t, 1.0);
            }
        }
    }
}

TEST(AngleGradient, PixelNearStartDirectionIsNearStartColor)
{
    DragGeometry drag(0, 0, 10, 0);
    SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, black, white, CYCLE_CLAMP));
    unsigned char px[4];

    double t = grad->Interpolate(10, 1);
    EXPECT_GT(t, 0.0);
    EXPECT_LT(t, 0.02);
    EXPECT_TRUE(grad->NeedsAntialiasing(10, 1, t));

    ASSERT_TRUE(grad->FillSpan(10, 1, 1, px));
    EXPECT_LT(px[0], 10);
    EXPECT_LT(px[1], 10);
    EXPECT_LT(px[2], 10);
    EXPECT_EQ(255, px[3]);
}

TEST(AngleGradient, ReflectOppositeStartDirectionIsEndColor)
{
    DragGeometry drag(0, 0, 10, 0);
    SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, black, white, CYCLE_REFLECT));
    unsigned char px[4];

    double t = grad->Interpolate(-10, 0);
    EXPECT_DOUBLE_EQ(1.0, t);
    EXPECT_FALSE(grad->NeedsAntialiasing(-10, 0, t));

    ASSERT_TRUE(grad->FillSpan(-10, 0, 1, px));
    EXPECT_EQ(255, px[0]);
    EXPECT_EQ(255, px[1]);
    EXPECT_EQ(255, px[2]);
    EXPECT_EQ(255, px[3]);
}

TEST(AngleGradient, ReflectIsNeverSupersampled)
{
    DragGeometry drag(0, 0, 10, 0);
    SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, black, white, CYCLE_REFLECT));

    for (int y = -8; y <= 8; ++y)
    {
        for (int x = -8; x <= 8; ++x)
            EXPECT_FALSE(grad->NeedsAntialiasing(x, y, grad->Interpolate(x, y)));
    }
}

TEST(AngleGradient, SeamBandNarrowsWithDistance)
{
    DragGeometry drag(0, 0, 10, 0);
    SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, black, white, CYCLE_CLAMP));

    // Same fraction t = 0.05: inside the band at distance 2 (0.2/2),
    // outside at distance 10 (0.2/10)
    EXPECT_TRUE(grad->NeedsAntialiasing(2, 0, 0.05));
    EXPECT_FALSE(grad->NeedsAntialiasing(10, 0, 0.05));
    EXPECT_TRUE(grad->NeedsAntialiasing(10, 0, 0.99));
    EXPECT_FALSE(grad->NeedsAntialiasing(10, 0, 0.5));
}

TEST(AngleGradient, RepeatHasSecondSeamAtHalfRevolution)
{
    DragGeometry drag(0, 0, 10, 0);
    SmartPtr<AngleGradient> repeat(CreateAngleGradient(drag, black, white, CYCLE_REPEAT));
    SmartPtr<AngleGradient> clamp(CreateAngleGradient(drag, black, white, CYCLE_CLAMP));

    // Just below the -x axis (clockwise side of the half revolution)
    double tr = repeat->Interpolate(-40, 0.5);
    double tc = clamp->Interpolate(-40, 0.5);

    EXPECT_TRUE(repeat->NeedsAntialiasing(-40, 0.5, tr));
    EXPECT_FALSE(clamp->NeedsAntialiasing(-40, 0.5, tc));
}

TEST(AngleGradient, SupersampledValueStaysWithinSubsampleRange)
{
    DragGeometry drag(0, 0, 10, 0);
    COLOR start = RGBA(10,40,200,255), end = RGBA(250,90,20,128);
    SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, start, end, CYCLE_REPEAT));
    const int xs[] = { 7, 25, -30, -12, 0 };
    const int ys[] = { 0, 0, 0, 0, 0 };
    const int s[4] = { GetRed(start), GetGreen(start), GetBlue(start), GetAlpha(start) };
    const int e[4] = { GetRed(end), GetGreen(end), GetBlue(end), GetAlpha(end) };

    for (int k = 0; k < ARRAY_LEN(xs); ++k)
    {
        int x = xs[k], y = ys[k];
        ASSERT_TRUE(grad->NeedsAntialiasing(x, y, grad->Interpolate(x, y)));

        unsigned char px[4];
        grad->FillSpan(x, y, 1, px);
        for (int c = 0; c < 4; ++c)
        {
            int lo = 255, hi = 0;
            for (int m = 0; m < AA_RES_DEFAULT; ++m)
            {
                for (int n = 0; n < AA_RES_DEFAULT; ++n)
                {
                    double tt = grad->Interpolate(x + 1.0/AA_RES_DEFAULT*n - 0.5,
                                                  y + 1.0/AA_RES_DEFAULT*m - 0.5);
                    int v = BlendChannel(s[c], e[c], tt);
                    lo = (v < lo) ? v : lo;
                    hi = (v > hi) ? v : hi;
                }
            }
            EXPECT_GE(px[c], lo) << "pixel " << x << "," << y << " channel " << c;
            EXPECT_LE(px[c], hi) << "pixel " << x << "," << y << " channel " << c;
        }
    }
}

// With the default accumulation, each subsample channel is truncated
// to an integer, and the sum is divided by the subsample count with
// integer division
TEST(AngleGradient, TruncatingAverageOfSubsamples)
{
    DragGeometry drag(0, 0, 10, 0);
    COLOR start = RGBA(13,200,77,255), end = RGBA(250,31,140,60);
    const int s[4] = { GetRed(start), GetGreen(start), GetBlue(start), GetAlpha(start) };
    const int e[4] = { GetRed(end), GetGreen(end), GetBlue(end), GetAlpha(end) };
    const CYCLE_METHOD cycles[] = { CYCLE_CLAMP, CYCLE_REPEAT };
    const CHANNEL_LAYOUT layouts[] = { LAYOUT_RGBA, LAYOUT_GRAY };
    const int res = AA_RES_DEFAULT;

    for (int i = 0; i < ARRAY_LEN(cycles); ++i)
    {
        for (int k = 0; k < ARRAY_LEN(layouts); ++k)
        {
            SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, start, end, cycles[i],
                                                             layouts[k]));
            int nchan = grad->GetChannelCount();
            int checked = 0;

            for (int y = -6; y <= 6; ++y)
            {
                for (int x = -40; x <= 40; ++x)
                {
                    if (!grad->NeedsAntialiasing(x, y, grad->Interpolate(x, y)))
                        continue;

                    unsigned char px[4];
                    grad->FillSpan(x, y, 1, px);
                    for (int c = 0; c < nchan; ++c)
                    {
                        int sum = 0;
                        for (int m = 0; m < res; ++m)
                        {
                            for (int n = 0; n < res; ++n)
                            {
                                double tt = grad->Interpolate(x + 1.0/res*n - 0.5,
                                                              y + 1.0/res*m - 0.5);
                                sum += BlendChannel(s[c], e[c], tt);
                            }
                        }
                        ASSERT_EQ(sum/(res*res), px[c]) << "pixel " << x << "," << y
                                << " channel " << c << " cycle " << cycles[i];
                    }
                    ++checked;
                }
            }
            EXPECT_GT(checked, 10) << "cycle " << cycles[i];
        }
    }
}

TEST(AngleGradient, UnsupersampledPixelIsDirectBlend)
{
    DragGeometry drag(0, 0, 10, 0);
    SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, black, RGBA(200,100,50,0), CYCLE_CLAMP));
    unsigned char px[4];

    double t = grad->Interpolate(0, 30);  // quarter revolution
    ASSERT_FALSE(grad->NeedsAntialiasing(0, 30, t));
    grad->FillSpan(0, 30, 1, px);
    EXPECT_EQ(BlendChannel(0, 200, t), px[0]);
    EXPECT_EQ(BlendChannel(0, 100, t), px[1]);
    EXPECT_EQ(BlendChannel(0, 50, t), px[2]);
    EXPECT_EQ(BlendChannel(255, 0, t), px[3]);
}

TEST(AngleGradient, GrayMatchesRedChannelOfRgba)
{
    DragGeometry drag(12.5, 9, 3, 20);
    COLOR start = RGBA(0,77,12,255), end = RGBA(255,3,190,40);
    AGRect rect = { -4, -4, 40, 32 };

    for (int accum = 0; accum < 2; ++accum)
    {
        AA_SETTINGS aa;
        aa.accum = (accum == 0) ? AA_ACCUM_TRUNCATE : AA_ACCUM_FLOAT;

        for (int i = 0; i < ARRAY_LEN(allCycles); ++i)
        {
            SmartPtr<AngleGradient> rgba(CreateAngleGradient(drag, start, end, allCycles[i],
                                                             LAYOUT_RGBA, &aa));
            SmartPtr<AngleGradient> gray(CreateAngleGradient(drag, start, end, allCycles[i],
                                                             LAYOUT_GRAY, &aa));
            std::vector<unsigned char> c = FillAll(rgba.get(), rect);
            std::vector<unsigned char> g = FillAll(gray.get(), rect);

            for (int k = 0; k < rect.w*rect.h; ++k)
                ASSERT_EQ(c[4*k], g[k]) << "sample " << k << " cycle " << i;
        }
    }
}

TEST(AngleGradient, FloatAccumulationStaysCloseToTruncation)
{
    DragGeometry drag(0, 0, 10, 0);
    AA_SETTINGS aa;
    AGRect rect = { -16, -16, 32, 32 };

    aa.accum = AA_ACCUM_FLOAT;
    SmartPtr<AngleGradient> trunc(CreateAngleGradient(drag, black, white, CYCLE_CLAMP));
    SmartPtr<AngleGradient> flt(CreateAngleGradient(drag, black, white, CYCLE_CLAMP,
                                                    LAYOUT_RGBA, &aa));
    std::vector<unsigned char> a = FillAll(trunc.get(), rect);
    std::vector<unsigned char> b = FillAll(flt.get(), rect);

    for (int k = 0; k < a.size(); ++k)
        EXPECT_LE(abs(int(a[k]) - int(b[k])), 2) << "byte " << k;
}

TEST(AngleGradient, EmptySpanOrRectWritesNothing)
{
    DragGeometry drag(0, 0, 10, 0);
    SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, black, white, CYCLE_REPEAT));
    unsigned char buf[64];
    AGRect noWidth = { 0, 0, 0, 4 };
    AGRect noHeight = { 0, 0, 4, -1 };

    memset(buf, 0xa5, sizeof(buf));
    EXPECT_FALSE(grad->FillSpan(0, 0, 0, buf));
    EXPECT_FALSE(grad->FillSpan(0, 0, -3, buf));
    EXPECT_FALSE(grad->FillRect(noWidth, buf));
    EXPECT_FALSE(grad->FillRect(noHeight, buf, 4));
    for (int i = 0; i < sizeof(buf); ++i)
        ASSERT_EQ(0xa5, buf[i]);
}

TEST(AngleGradient, FillRectRowsMatchFillSpan)
{
    DragGeometry drag(7, 5, 1, 2);
    SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, RGBA(9,8,7,6), RGBA(200,210,220,230),
                                                     CYCLE_REPEAT));
    AGRect rect = { 2, -3, 17, 11 };
    std::vector<unsigned char> all = FillAll(grad.get(), rect);
    std::vector<unsigned char> row(rect.w*4);

    for (int j = 0; j < rect.h; ++j)
    {
        grad->FillSpan(rect.x, rect.y + j, rect.w, &row[0]);
        ASSERT_EQ(0, memcmp(&row[0], &all[j*rect.w*4], row.size())) << "row " << j;
    }
}

TEST(AngleGradient, ThreadedFillMatchesSingleThreadedFill)
{
    DragGeometry drag(31, 17, 80, -5);
    AGRect rect = { 0, 0, 61, 37 };

    for (int i = 0; i < ARRAY_LEN(allCycles); ++i)
    {
        SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, black, white, allCycles[i]));
        std::vector<unsigned char> one = FillAll(grad.get(), rect, 1);

        EXPECT_EQ(one, FillAll(grad.get(), rect, 3));
        EXPECT_EQ(one, FillAll(grad.get(), rect, 8));
        EXPECT_EQ(one, FillAll(grad.get(), rect, 100));  // more threads than rows
    }
}

TEST(AngleGradient, HugeThreadCountIsLimited)
{
    DragGeometry drag(20, 900, 50, 300);
    SmartPtr<AngleGradient> grad(CreateAngleGradient(drag, black, white, CYCLE_REPEAT));
    AGRect rect = { 0, 0, 64, 2000 };
    std::vector<unsigned char> one = FillAll(grad.get(), rect, 1);

    EXPECT_EQ(one, FillAll(grad.get(), rect, 2000));
    EXPECT_EQ(one, FillAll(grad.get(), rect, 1000000));
}
