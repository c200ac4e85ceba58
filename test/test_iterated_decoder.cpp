#include <gtest/gtest.h>
#include "cipher/IteratedDecoder.h"
#include "cipher/ArnoldTransform.h"
#include "TestImages.h"

using namespace Cipher;

namespace {

TransformParams params(int k, qint64 a, qint64 b)
{
    TransformParams p;
    p.iterations = k;
    p.a = a;
    p.b = b;
    return p;
}

} // namespace

TEST(IteratedDecoderTest, ZeroIterationsReturnsCopy)
{
    const ImageBuffer src = TestImages::indexed(6);
    EXPECT_EQ(decode(src, params(0, 3, 4)), src);
    EXPECT_EQ(encode(src, params(0, 3, 4)), src);
}

TEST(IteratedDecoderTest, SinglePassMatchesTransformOnce)
{
    const ImageBuffer src = TestImages::indexed(7);
    ImageBuffer once;
    ASSERT_TRUE(transformOnce(src, once, 2, 5));
    EXPECT_EQ(decode(src, params(1, 2, 5)), once);
}

TEST(IteratedDecoderTest, PassesCompose)
{
    const ImageBuffer src = TestImages::indexed(8);
    const ImageBuffer twoThenThree = decode(decode(src, params(2, 1, 3)), params(3, 1, 3));
    EXPECT_EQ(decode(src, params(5, 1, 3)), twoThenThree);
}

TEST(IteratedDecoderTest, PreservesPixelMultiset)
{
    const ImageBuffer src = TestImages::gradient(8);
    const ImageBuffer out = decode(src, params(3, 2, 7));
    ASSERT_TRUE(out.sameGeometry(src));
    EXPECT_NE(out, src);
    EXPECT_EQ(TestImages::sortedPixels(out), TestImages::sortedPixels(src));
}

TEST(IteratedDecoderTest, DecodeUndoesEncode)
{
    const ImageBuffer src = TestImages::indexed(9);
    const TransformParams cases[] = {
        params(1, 1, 1), params(3, 1, 1), params(5, 2, 3), params(2, -1, -4), params(7, 10, -3)
    };
    for (const TransformParams& p : cases) {
        EXPECT_EQ(decode(encode(src, p), p), src) << p.toString().toStdString();
    }
}

TEST(IteratedDecoderTest, PeriodThreeOnFourByFour)
{
    // A = [[1,1],[1,2]] cubed is the identity mod 4
    const ImageBuffer src = TestImages::gradient(4);
    EXPECT_EQ(encode(src, params(3, 1, 1)), src);
    EXPECT_NE(encode(src, params(1, 1, 1)), src);
}

TEST(IteratedDecoderTest, NonSquareYieldsEmptyBuffer)
{
    const ImageBuffer src(5, 4);
    EXPECT_FALSE(decode(src, params(2, 1, 1)).isValid());
    EXPECT_FALSE(encode(src, params(2, 1, 1)).isValid());
}
