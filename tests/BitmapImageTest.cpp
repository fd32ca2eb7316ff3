#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "Image/headers/BitmapImage.h"
#include "Grid/headers/GridErrors.h"
#include "TestSupport.h"

using testsupport::makeBmp24;

namespace {
    const std::vector<uint8_t> kSixPixels = {
        255, 0, 0, 0, 255, 0, 0, 0, 255,
        10, 20, 30, 40, 50, 60, 70, 80, 90
    };
}

TEST(BitmapImageTest, NewImageIsBlack) {
    BitmapImage image(3, 2);
    EXPECT_EQ(image.getWidth(), 3);
    EXPECT_EQ(image.getHeight(), 2);
    EXPECT_EQ(image.pixelCount(), 6u);
    for (size_t i = 0; i < 6; ++i) {
        EXPECT_EQ(image.getPixel(i), (Rgb{0, 0, 0}));
    }
}

TEST(BitmapImageTest, InvalidDimensionsThrow) {
    EXPECT_THROW(BitmapImage(0, 5), std::invalid_argument);
    EXPECT_THROW(BitmapImage(5, -1), std::invalid_argument);
}

TEST(BitmapImageTest, PixelIndexIsRowMajor) {
    BitmapImage image(3, 2);
    image.setPixel(2, 1, Rgb{1, 2, 3});
    EXPECT_EQ(image.getPixel(5), (Rgb{1, 2, 3}));
    EXPECT_THROW(image.getPixel(6), std::out_of_range);
    EXPECT_THROW(image.setPixel(3, 0, Rgb{}), std::out_of_range);
}

TEST(BitmapImageTest, CopyIsIndependent) {
    BitmapImage original(2, 2);
    original.setPixel(0, 0, Rgb{9, 9, 9});
    BitmapImage copy = original;
    copy.setPixel(0, 0, Rgb{1, 1, 1});
    EXPECT_EQ(original.getPixel(0, 0), (Rgb{9, 9, 9}));
    EXPECT_EQ(copy.getPixel(0, 0), (Rgb{1, 1, 1}));
}

TEST(BitmapImageTest, LoadsBottomUpBmp) {
    testsupport::TempFile file(".bmp");
    file.write(makeBmp24(3, 2, kSixPixels, false));

    BitmapImage image = BitmapImage::load(file.path());
    ASSERT_EQ(image.getWidth(), 3);
    ASSERT_EQ(image.getHeight(), 2);
    EXPECT_EQ(image.pixelCount(), 6u);
    EXPECT_EQ(image.getPixel(0), (Rgb{255, 0, 0}));
    EXPECT_EQ(image.getPixel(2), (Rgb{0, 0, 255}));
    EXPECT_EQ(image.getPixel(3), (Rgb{10, 20, 30}));
    EXPECT_EQ(image.getPixel(5), (Rgb{70, 80, 90}));
}

TEST(BitmapImageTest, LoadsTopDownBmp) {
    testsupport::TempFile file(".bmp");
    file.write(makeBmp24(3, 2, kSixPixels, true));

    BitmapImage image = BitmapImage::load(file.path());
    EXPECT_EQ(image.getPixel(1), (Rgb{0, 255, 0}));
    EXPECT_EQ(image.getPixel(4), (Rgb{40, 50, 60}));
}

TEST(BitmapImageTest, LoadsPpm) {
    testsupport::TempFile file(".ppm");
    std::vector<uint8_t> bytes = testsupport::makePpm(3, 2, kSixPixels);
    file.write(bytes);

    BitmapImage image = BitmapImage::load(file.path());
    ASSERT_EQ(image.getWidth(), 3);
    ASSERT_EQ(image.getHeight(), 2);
    EXPECT_EQ(image.getPixel(0), (Rgb{255, 0, 0}));
    EXPECT_EQ(image.getPixel(5), (Rgb{70, 80, 90}));
}

TEST(BitmapImageTest, PpmHeaderCommentsAreSkipped) {
    testsupport::TempFile file(".ppm");
    std::string text = "P6\n# made by hand\n1 1\n# max\n255\n";
    text.push_back(static_cast<char>(12));
    text.push_back(static_cast<char>(34));
    text.push_back(static_cast<char>(56));
    file.write(text);

    BitmapImage image = BitmapImage::load(file.path());
    EXPECT_EQ(image.getPixel(0), (Rgb{12, 34, 56}));
}

TEST(BitmapImageTest, ShortPixelDataReportsActualCount) {
    testsupport::TempFile file(".ppm");
    std::vector<uint8_t> bytes = testsupport::makePpm(3, 2, kSixPixels);
    bytes.resize(bytes.size() - 7); // last two pixels incomplete
    file.write(bytes);

    BitmapImage image = BitmapImage::load(file.path());
    EXPECT_EQ(image.getWidth(), 3);
    EXPECT_EQ(image.getHeight(), 2);
    EXPECT_EQ(image.pixelCount(), 3u);
    EXPECT_EQ(image.getPixel(2), (Rgb{0, 0, 255}));
    EXPECT_EQ(image.decodedColumns(0), 3);
    EXPECT_EQ(image.decodedColumns(1), 0);
}

TEST(BitmapImageTest, ShortBottomUpBmpKeepsItsBottomRows) {
    testsupport::TempFile file(".bmp");
    std::vector<uint8_t> bytes = makeBmp24(3, 2, kSixPixels, false);
    bytes.resize(54 + 12); // first stored row only, which is the bottom image row
    file.write(bytes);

    BitmapImage image = BitmapImage::load(file.path());
    EXPECT_EQ(image.pixelCount(), 3u);
    EXPECT_EQ(image.decodedColumns(0), 0);
    EXPECT_EQ(image.decodedColumns(1), 3);
    EXPECT_EQ(image.getPixel(0, 1), (Rgb{10, 20, 30}));
    EXPECT_EQ(image.getPixel(2, 1), (Rgb{70, 80, 90}));
}

TEST(BitmapImageTest, ShortBottomUpBmpWithPartialTopRow) {
    testsupport::TempFile file(".bmp");
    std::vector<uint8_t> bytes = makeBmp24(3, 2, kSixPixels, false);
    bytes.resize(54 + 12 + 4); // one pixel of the top row
    file.write(bytes);

    BitmapImage image = BitmapImage::load(file.path());
    EXPECT_EQ(image.pixelCount(), 4u);
    EXPECT_EQ(image.decodedColumns(0), 1);
    EXPECT_EQ(image.decodedColumns(1), 3);
    EXPECT_EQ(image.getPixel(0, 0), (Rgb{255, 0, 0}));
}

TEST(BitmapImageTest, CompleteImageHasFullRows) {
    BitmapImage image(4, 2);
    EXPECT_EQ(image.decodedColumns(0), 4);
    EXPECT_EQ(image.decodedColumns(1), 4);
    EXPECT_THROW((void) image.decodedColumns(2), std::out_of_range);
}

TEST(BitmapImageTest, ResizeKeepsUndecodedPixelsUndecoded) {
    testsupport::TempFile file(".ppm");
    // 20x2 declared, first row and half of the second present
    file.write(testsupport::makePpm(20, 2, std::vector<uint8_t>(30 * 3, 90)));

    BitmapImage image = BitmapImage::load(file.path());
    ASSERT_EQ(image.pixelCount(), 30u);

    image.resize(2, 16);
    // Target column x samples source column x * 20 / 16; columns 0..7 read source 0..8
    EXPECT_EQ(image.decodedColumns(0), 16);
    EXPECT_EQ(image.decodedColumns(1), 8);
    EXPECT_EQ(image.pixelCount(), 24u);
    EXPECT_EQ(image.getPixel(7, 1), (Rgb{90, 90, 90}));
}

TEST(BitmapImageTest, CopyKeepsDecodedExtents) {
    testsupport::TempFile file(".ppm");
    file.write(testsupport::makePpm(2, 2, std::vector<uint8_t>(3 * 3, 5)));

    BitmapImage image = BitmapImage::load(file.path());
    BitmapImage copy(image);
    EXPECT_EQ(copy.pixelCount(), 3u);
    EXPECT_EQ(copy.decodedColumns(1), 1);

    BitmapImage moved(std::move(copy));
    EXPECT_EQ(moved.decodedColumns(1), 1);
}

TEST(BitmapImageTest, MissingFileIsDecodeError) {
    EXPECT_THROW(BitmapImage::load("/nonexistent/gridpainter/image.bmp"), DecodeError);
}

TEST(BitmapImageTest, UnknownFormatIsDecodeError) {
    testsupport::TempFile file(".txt");
    file.write(std::string("GIF89a not really"));
    EXPECT_THROW(BitmapImage::load(file.path()), DecodeError);
}

TEST(BitmapImageTest, TruncatedBmpHeaderIsDecodeError) {
    testsupport::TempFile file(".bmp");
    file.write(std::vector<uint8_t>{'B', 'M', 0, 0, 0});
    EXPECT_THROW(BitmapImage::load(file.path()), DecodeError);
}

TEST(BitmapImageTest, SaveThenLoadKeepsPixels) {
    BitmapImage image(5, 3); // 15-byte rows need padding
    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 5; ++x) {
            image.setPixel(x, y, Rgb{static_cast<uint8_t>(x * 40), static_cast<uint8_t>(y * 80), 7});
        }
    }
    testsupport::TempFile file(".bmp");
    ASSERT_TRUE(image.save(file.path()));

    BitmapImage loaded = BitmapImage::load(file.path());
    ASSERT_EQ(loaded.getWidth(), 5);
    ASSERT_EQ(loaded.getHeight(), 3);
    EXPECT_EQ(loaded.getPixel(4, 2), (Rgb{160, 160, 7}));
    EXPECT_EQ(loaded.getPixel(0, 0), (Rgb{0, 0, 7}));
}

TEST(BitmapImageTest, NearestNeighbourDownscale) {
    BitmapImage image(4, 4);
    // Quadrants: red, green / blue, white
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            Rgb c = y < 2 ? (x < 2 ? Rgb{255, 0, 0} : Rgb{0, 255, 0})
                          : (x < 2 ? Rgb{0, 0, 255} : Rgb{255, 255, 255});
            image.setPixel(x, y, c);
        }
    }
    image.resize(2, 2);
    ASSERT_EQ(image.getWidth(), 2);
    ASSERT_EQ(image.getHeight(), 2);
    EXPECT_EQ(image.pixelCount(), 4u);
    EXPECT_EQ(image.getPixel(0, 0), (Rgb{255, 0, 0}));
    EXPECT_EQ(image.getPixel(1, 0), (Rgb{0, 255, 0}));
    EXPECT_EQ(image.getPixel(0, 1), (Rgb{0, 0, 255}));
    EXPECT_EQ(image.getPixel(1, 1), (Rgb{255, 255, 255}));
}

TEST(BitmapImageTest, ResizeArgumentOrderIsHeightThenWidth) {
    BitmapImage image(10, 4);
    image.resize(2, 5);
    EXPECT_EQ(image.getHeight(), 2);
    EXPECT_EQ(image.getWidth(), 5);
    EXPECT_THROW(image.resize(0, 5), std::invalid_argument);
}

TEST(BitmapImageTest, ReleasedPixelsAreCollectable) {
    auto &rm = ResourceManager::getInstance();
    rm.collect();
    {
        BitmapImage image(64, 64);
    }
    EXPECT_GE(rm.getIdlePooledBytes(), 64u * 64u * 3u);
    EXPECT_GE(rm.collect(), 64u * 64u * 3u);
    EXPECT_EQ(rm.getIdlePooledBytes(), 0u);
}
