/**
 * @file frame_codec_test.cpp
 * @brief Frame codec and BMP decoder tests (GoogleTest, host).
 */

#include <gtest/gtest.h>
#include <algorithm>
#include "bmp_decoder.h"
#include "frame_codec.h"


static const PanelGeometry PANEL = {EPAPER_WIDTH, EPAPER_HEIGHT};


static DecodedImage grayImage(uint32_t width, uint32_t height, uint8_t value) {
    DecodedImage image;
    image.width = width;
    image.height = height;
    image.format = PIXEL_GRAY8;
    image.pixels.assign((size_t)width * height, value);
    return image;
}


/*
 * =============================================================================
 * ENCODER
 * =============================================================================
 */

TEST(FrameEncode, OutputSizeFollowsTargetOnly) {
    Bitmap frame;

    ASSERT_EQ(ESP_OK, frameEncode(grayImage(37, 11, 200), PANEL, 128, false, &frame));
    EXPECT_EQ(48000u, frame.data.size());
    EXPECT_EQ(800u, frame.geometry.width);
    EXPECT_EQ(480u, frame.geometry.height);

    ASSERT_EQ(ESP_OK, frameEncode(grayImage(1600, 960, 10), PanelGeometry{16, 3}, 128, false, &frame));
    EXPECT_EQ(6u, frame.data.size());
}


TEST(FrameEncode, AllWhiteImageIsAllOnes) {
    DecodedImage image;
    image.width = 800;
    image.height = 480;
    image.format = PIXEL_RGB888;
    image.pixels.assign(800u * 480u * 3u, 0xFF);

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PANEL, 128, false, &frame));
    EXPECT_EQ(std::vector<uint8_t>(48000, 0xFF), frame.data);
}


TEST(FrameEncode, FirstPixelBlackPacksMsbFirst) {
    DecodedImage image = grayImage(8, 2, 255);
    image.pixels[0] = 0;

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 2}, 128, false, &frame));
    ASSERT_EQ(2u, frame.data.size());
    EXPECT_EQ(0x7F, frame.data[0]);
    EXPECT_EQ(0xFF, frame.data[1]);
}


TEST(FrameEncode, IsDeterministic) {
    DecodedImage image = grayImage(123, 77, 0);
    for (size_t i = 0; i < image.pixels.size(); i++) image.pixels[i] = (uint8_t)(i * 13);

    Bitmap a, b;
    ASSERT_EQ(ESP_OK, frameEncode(image, PANEL, 100, false, &a));
    ASSERT_EQ(ESP_OK, frameEncode(image, PANEL, 100, false, &b));
    EXPECT_EQ(a.data, b.data);
}


TEST(FrameEncode, InvertComplementsEveryByte) {
    DecodedImage image = grayImage(64, 40, 0);
    for (size_t i = 0; i < image.pixels.size(); i++) image.pixels[i] = (uint8_t)(i * 31);

    Bitmap normal, dark;
    ASSERT_EQ(ESP_OK, frameEncode(image, PANEL, 128, false, &normal));
    ASSERT_EQ(ESP_OK, frameEncode(image, PANEL, 128, true, &dark));

    ASSERT_EQ(normal.data.size(), dark.data.size());
    for (size_t i = 0; i < normal.data.size(); i++) {
        ASSERT_EQ((uint8_t)~normal.data[i], dark.data[i]) << "byte " << i;
    }
}


TEST(FrameEncode, ThresholdIsInclusive) {
    const PanelGeometry tiny = {8, 1};
    Bitmap frame;

    ASSERT_EQ(ESP_OK, frameEncode(grayImage(8, 1, 128), tiny, 128, false, &frame));
    EXPECT_EQ(0xFF, frame.data[0]);

    ASSERT_EQ(ESP_OK, frameEncode(grayImage(8, 1, 127), tiny, 128, false, &frame));
    EXPECT_EQ(0x00, frame.data[0]);

    // Threshold 0: everything is white
    ASSERT_EQ(ESP_OK, frameEncode(grayImage(8, 1, 0), tiny, 0, false, &frame));
    EXPECT_EQ(0xFF, frame.data[0]);
}


TEST(FrameEncode, LumaWeights) {
    EXPECT_EQ(0, frameLuma(0, 0, 0));
    EXPECT_EQ(255, frameLuma(255, 255, 255));
    EXPECT_EQ(76, frameLuma(255, 0, 0));     // 299 * 255 / 1000
    EXPECT_EQ(149, frameLuma(0, 255, 0));    // 587 * 255 / 1000
    EXPECT_EQ(29, frameLuma(0, 0, 255));     // 114 * 255 / 1000

    // Pure green is white at 128, pure red is not
    DecodedImage image;
    image.width = 2;
    image.height = 1;
    image.format = PIXEL_RGB888;
    image.pixels = {255, 0, 0, 0, 255, 0};

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 1}, 128, false, &frame));
    EXPECT_EQ(0x0F, frame.data[0]);
}


TEST(FrameEncode, NearestNeighbourUpscale) {
    // 2x1 source: left black, right white -> left half black on the panel
    DecodedImage image = grayImage(2, 1, 0);
    image.pixels[1] = 255;

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{16, 2}, 128, false, &frame));
    EXPECT_EQ(std::vector<uint8_t>({0x00, 0xFF, 0x00, 0xFF}), frame.data);
}


TEST(FrameEncode, NearestNeighbourDownscaleSamplesCentres) {
    // 32 columns in runs of 2 (W W B B ...) -> 8 panel columns, each
    // sampling source column 4x+2, which always falls on a black run.
    DecodedImage image = grayImage(32, 1, 255);
    for (uint32_t x = 0; x < 32; x++) {
        if ((x / 2) % 2 == 1) image.pixels[x] = 0;
    }

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 1}, 128, false, &frame));
    EXPECT_EQ(0x00, frame.data[0]);
}


TEST(FrameEncode, SixteenBitSamplesUseHighByte) {
    DecodedImage image;
    image.width = 2;
    image.height = 1;
    image.format = PIXEL_GRAY16;
    image.pixels = {0x80, 0x00, 0x7F, 0xFF};   // 0x8000 and 0x7FFF, big-endian

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 1}, 128, false, &frame));
    EXPECT_EQ(0xF0, frame.data[0]);
}


TEST(FrameEncode, RgbaIgnoresAlpha) {
    DecodedImage image;
    image.width = 1;
    image.height = 1;
    image.format = PIXEL_RGBA8888;
    image.pixels = {255, 255, 255, 0};

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 1}, 128, false, &frame));
    EXPECT_EQ(0xFF, frame.data[0]);
}


TEST(FrameEncode, RejectsBadInput) {
    Bitmap frame;
    DecodedImage image = grayImage(8, 8, 0);

    EXPECT_EQ(ESP_ERR_INVALID_ARG, frameEncode(image, PanelGeometry{801, 480}, 128, false, &frame));
    EXPECT_EQ(ESP_ERR_INVALID_ARG, frameEncode(image, PanelGeometry{800, 0}, 128, false, &frame));
    EXPECT_EQ(ESP_ERR_INVALID_ARG, frameEncode(image, PANEL, 128, false, nullptr));
    EXPECT_EQ(ESP_ERR_INVALID_ARG, frameEncode(grayImage(0, 0, 0), PANEL, 128, false, &frame));

    image.pixels.resize(10);
    EXPECT_EQ(ESP_ERR_INVALID_ARG, frameEncode(image, PANEL, 128, false, &frame));
}


TEST(FrameEncode, FillProducesSolidFrames) {
    Bitmap frame;
    bitmapFill(PANEL, true, &frame);
    EXPECT_EQ(std::vector<uint8_t>(48000, 0xFF), frame.data);

    bitmapFill(PANEL, false, &frame);
    EXPECT_EQ(std::vector<uint8_t>(48000, 0x00), frame.data);
}


TEST(FrameEncode, IndexedPixelsUsePalette) {
    // 2-bit indices 0 1 2 3 over black, white, red, green
    DecodedImage image;
    image.width = 4;
    image.height = 1;
    image.format = PIXEL_INDEXED2;
    image.pixels = {0x1B};
    image.palette = {0, 0, 0,   255, 255, 255,   255, 0, 0,   0, 255, 0};

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 1}, 128, false, &frame));
    EXPECT_EQ(0x33, frame.data[0]);
}


TEST(FrameEncode, IndexPastPaletteReadsEntryZero) {
    DecodedImage image;
    image.width = 8;
    image.height = 1;
    image.format = PIXEL_INDEXED1;
    image.pixels = {0x0F};
    image.palette = {255, 255, 255};    // only entry 0 (white)

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 1}, 128, false, &frame));
    EXPECT_EQ(0xFF, frame.data[0]);
}


TEST(FrameEncode, IndexedWithoutPaletteIsRejected) {
    DecodedImage image;
    image.width = 8;
    image.height = 1;
    image.format = PIXEL_INDEXED1;
    image.pixels = {0x0F};

    Bitmap frame;
    EXPECT_EQ(ESP_ERR_INVALID_ARG, frameEncode(image, PanelGeometry{8, 1}, 128, false, &frame));
}


TEST(FrameEncode, RowBytesRoundUpPerRow) {
    EXPECT_EQ(1u, pixelRowBytes(PIXEL_INDEXED1, 3));
    EXPECT_EQ(100u, pixelRowBytes(PIXEL_INDEXED1, 800));
    EXPECT_EQ(2u, pixelRowBytes(PIXEL_INDEXED4, 3));
    EXPECT_EQ(2400u, pixelRowBytes(PIXEL_BGR888, 800));
    EXPECT_EQ(12u, pixelRowBytes(PIXEL_RGB161616, 2));

    // 3-pixel 1-bit rows: each row owns a byte
    DecodedImage image;
    image.width = 3;
    image.height = 2;
    image.format = PIXEL_INDEXED1;
    image.pixels = {0x00, 0xE0};
    image.palette = {0, 0, 0,   255, 255, 255};

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 2}, 128, false, &frame));
    EXPECT_EQ(std::vector<uint8_t>({0x00, 0xFF}), frame.data);
}


TEST(FrameEncode, GrayAlphaAndBgrOrder) {
    DecodedImage gray;
    gray.width = 2;
    gray.height = 1;
    gray.format = PIXEL_GRAYA88;
    gray.pixels = {0, 255,   255, 0};

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(gray, PanelGeometry{8, 1}, 128, false, &frame));
    EXPECT_EQ(0x0F, frame.data[0]);

    // Blue then green in file order B, G, R
    DecodedImage bgr;
    bgr.width = 2;
    bgr.height = 1;
    bgr.format = PIXEL_BGR888;
    bgr.pixels = {255, 0, 0,   0, 255, 0};

    ASSERT_EQ(ESP_OK, frameEncode(bgr, PanelGeometry{8, 1}, 128, false, &frame));
    EXPECT_EQ(0x0F, frame.data[0]);
}


/*
 * =============================================================================
 * STREAMING ENCODER
 * =============================================================================
 */

TEST(FrameEncoder, PushBeforeBeginIsRefused) {
    Bitmap frame;
    FrameEncoder encoder(PanelGeometry{8, 1}, 128, false, &frame);
    const uint8_t row[8] = {};

    EXPECT_EQ(ESP_ERR_INVALID_STATE, encoder.pushRows(0, 0, 8, 1, row, 0, PIXEL_GRAY8));
    EXPECT_EQ(ESP_ERR_INVALID_ARG, encoder.begin(0, 4));
    EXPECT_EQ(ESP_ERR_INVALID_STATE, encoder.pushRows(0, 0, 8, 1, row, 0, PIXEL_GRAY8));
}


TEST(FrameEncoder, BlocksInAnyOrderMatchWholeImage) {
    // 16x16 source in four 8x8 blocks, like a JPEG decoder hands them out
    DecodedImage image = grayImage(16, 16, 0);
    for (size_t i = 0; i < image.pixels.size(); i++) image.pixels[i] = (uint8_t)(i * 37);

    Bitmap whole;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{24, 12}, 128, false, &whole));

    Bitmap blocks;
    FrameEncoder encoder(PanelGeometry{24, 12}, 128, false, &blocks);
    ASSERT_EQ(ESP_OK, encoder.begin(16, 16));

    const uint32_t order[4][2] = {{8, 8}, {0, 0}, {8, 0}, {0, 8}};
    for (const auto& corner : order) {
        const uint8_t* first = image.pixels.data() + corner[1] * 16 + corner[0];
        ASSERT_EQ(ESP_OK, encoder.pushRows(corner[0], corner[1], 8, 8, first, 16, PIXEL_GRAY8));
    }
    EXPECT_EQ(whole.data, blocks.data);
}


TEST(FrameEncoder, EdgeBlocksPastTheImageAreClipped) {
    // 5x1 white source delivered as one 8-wide block; columns 5..7 are junk
    Bitmap frame;
    FrameEncoder encoder(PanelGeometry{8, 1}, 128, false, &frame);
    ASSERT_EQ(ESP_OK, encoder.begin(5, 1));

    const uint8_t block[2][8] = {
        {255, 255, 255, 255, 255, 0, 0, 0},
        {0, 0, 0, 0, 0, 0, 0, 0}
    };
    ASSERT_EQ(ESP_OK, encoder.pushRows(0, 0, 8, 2, &block[0][0], 8, PIXEL_GRAY8));
    EXPECT_EQ(0xFF, frame.data[0]);
}


TEST(FrameEncoder, MissingRowsStayBlack) {
    Bitmap frame;
    FrameEncoder encoder(PanelGeometry{8, 2}, 128, false, &frame);
    ASSERT_EQ(ESP_OK, encoder.begin(8, 2));

    const uint8_t white[8] = {255, 255, 255, 255, 255, 255, 255, 255};
    ASSERT_EQ(ESP_OK, encoder.pushRows(0, 1, 8, 1, white, 0, PIXEL_GRAY8));
    EXPECT_EQ(std::vector<uint8_t>({0x00, 0xFF}), frame.data);
}


TEST(FrameEncoder, LaterPixelsOverwriteEarlierOnes) {
    Bitmap frame;
    FrameEncoder encoder(PanelGeometry{8, 1}, 128, false, &frame);
    ASSERT_EQ(ESP_OK, encoder.begin(8, 1));

    const uint8_t white[8] = {255, 255, 255, 255, 255, 255, 255, 255};
    const uint8_t black[8] = {};
    ASSERT_EQ(ESP_OK, encoder.pushRows(0, 0, 8, 1, white, 0, PIXEL_GRAY8));
    ASSERT_EQ(ESP_OK, encoder.pushRows(0, 0, 4, 1, black, 0, PIXEL_GRAY8));
    EXPECT_EQ(0x0F, frame.data[0]);
}


/*
 * =============================================================================
 * BMP DECODER
 * =============================================================================
 */

static void put16(std::vector<uint8_t>& b, size_t at, uint16_t v) {
    b[at] = v & 0xFF;
    b[at + 1] = v >> 8;
}


static void put32(std::vector<uint8_t>& b, size_t at, uint32_t v) {
    for (int i = 0; i < 4; i++) b[at + i] = (uint8_t)(v >> (8 * i));
}


/*
 * Minimal BITMAPINFOHEADER file. Rows are given top row first and written
 * bottom-up unless topDown is set. Each row must already be padded.
 */
static std::vector<uint8_t> makeBmp(int32_t width, int32_t height, uint16_t depth,
                                    const std::vector<uint8_t>& palette,
                                    const std::vector<std::vector<uint8_t>>& rows,
                                    bool topDown = false) {
    const size_t dataOffset = 54 + palette.size();
    std::vector<uint8_t> bmp(dataOffset, 0);
    bmp[0] = 'B';
    bmp[1] = 'M';
    put32(bmp, 10, (uint32_t)dataOffset);
    put32(bmp, 14, 40);
    put32(bmp, 18, (uint32_t)width);
    put32(bmp, 22, (uint32_t)(topDown ? -height : height));
    put16(bmp, 26, 1);
    put16(bmp, 28, depth);
    put32(bmp, 30, 0);
    put32(bmp, 46, depth <= 8 ? (uint32_t)(palette.size() / 4) : 0);
    std::copy(palette.begin(), palette.end(), bmp.begin() + 54);

    for (size_t i = 0; i < rows.size(); i++) {
        const std::vector<uint8_t>& row = topDown ? rows[i] : rows[rows.size() - 1 - i];
        bmp.insert(bmp.end(), row.begin(), row.end());
    }
    put32(bmp, 2, (uint32_t)bmp.size());
    return bmp;
}


static const std::vector<uint8_t> MONO_PALETTE = {
    0x00, 0x00, 0x00, 0x00,     // 0 = black
    0xFF, 0xFF, 0xFF, 0x00      // 1 = white
};


static std::vector<uint8_t> bmpRgbPalette(const std::vector<uint8_t>& bmpPalette) {
    std::vector<uint8_t> rgb;
    for (size_t i = 0; i + 4 <= bmpPalette.size(); i += 4) {
        rgb.push_back(bmpPalette[i + 2]);
        rgb.push_back(bmpPalette[i + 1]);
        rgb.push_back(bmpPalette[i]);
    }
    return rgb;
}


TEST(BmpDecode, OneBitBottomUpStaysPacked) {
    // Top row: 4 black then 4 white. Bottom row: all white.
    std::vector<uint8_t> bmp = makeBmp(8, 2, 1, MONO_PALETTE,
                                       {{0x0F, 0, 0, 0}, {0xFF, 0, 0, 0}});

    DecodedImage image;
    ASSERT_EQ(ESP_OK, bmpDecode(bmp.data(), bmp.size(), &image));
    EXPECT_EQ(8u, image.width);
    EXPECT_EQ(2u, image.height);
    EXPECT_EQ(PIXEL_INDEXED1, image.format);
    EXPECT_EQ(std::vector<uint8_t>({0x0F, 0xFF}), image.pixels);
    EXPECT_EQ(std::vector<uint8_t>({0, 0, 0, 255, 255, 255}), image.palette);

    // Straight through the encoder: the panel frame equals the file bits
    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 2}, 128, false, &frame));
    EXPECT_EQ(std::vector<uint8_t>({0x0F, 0xFF}), frame.data);
}


TEST(BmpDecode, FullPanelOneBitDecodesToFrameSize) {
    // A server frame: 800x480, 1-bit, rows already 4-byte aligned (100 bytes)
    std::vector<std::vector<uint8_t>> rows(480, std::vector<uint8_t>(100));
    for (size_t y = 0; y < rows.size(); y++) {
        for (size_t i = 0; i < 100; i++) rows[y][i] = (uint8_t)(y * 100 + i * 7);
    }
    std::vector<uint8_t> bmp = makeBmp(800, 480, 1, MONO_PALETTE, rows);

    DecodedImage image;
    ASSERT_EQ(ESP_OK, bmpDecode(bmp.data(), bmp.size(), &image));
    EXPECT_EQ(PIXEL_INDEXED1, image.format);
    EXPECT_EQ(48000u, image.pixels.size());

    // Same bytes come out of the encoder, with or without the decoded copy
    std::vector<uint8_t> expected;
    for (const std::vector<uint8_t>& row : rows) expected.insert(expected.end(), row.begin(), row.end());

    Bitmap decoded;
    ASSERT_EQ(ESP_OK, frameEncode(image, PANEL, 128, false, &decoded));
    EXPECT_EQ(expected, decoded.data);

    Bitmap streamed;
    FrameEncoder encoder(PANEL, 128, false, &streamed);
    ASSERT_EQ(ESP_OK, bmpStream(bmp.data(), bmp.size(), &encoder));
    EXPECT_EQ(expected, streamed.data);
}


TEST(BmpDecode, TopDownRowsKeepOrder) {
    std::vector<uint8_t> bmp = makeBmp(8, 2, 1, MONO_PALETTE,
                                       {{0x0F, 0, 0, 0}, {0xFF, 0, 0, 0}}, true);

    DecodedImage image;
    ASSERT_EQ(ESP_OK, bmpDecode(bmp.data(), bmp.size(), &image));
    EXPECT_EQ(0x0F, image.pixels[0]);
    EXPECT_EQ(0xFF, image.pixels[1]);
}


TEST(BmpDecode, FourBitPalettised) {
    const std::vector<uint8_t> palette = {
        0x00, 0x00, 0x00, 0x00,     // 0 = black
        0xFF, 0xFF, 0xFF, 0x00,     // 1 = white
        0x80, 0x80, 0x80, 0x00      // 2 = mid gray
    };
    // Indices 1, 0, 2 -> nibbles 1 0 | 2 (pad)
    std::vector<uint8_t> bmp = makeBmp(3, 1, 4, palette, {{0x10, 0x20, 0, 0}});

    DecodedImage image;
    ASSERT_EQ(ESP_OK, bmpDecode(bmp.data(), bmp.size(), &image));
    EXPECT_EQ(PIXEL_INDEXED4, image.format);
    EXPECT_EQ(std::vector<uint8_t>({0x10, 0x20}), image.pixels);
    EXPECT_EQ(bmpRgbPalette(palette), image.palette);

    // 3 -> 8 columns sample 0 0 0 1 1 2 2 2: white white white black black gray...
    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 1}, 128, false, &frame));
    EXPECT_EQ(0xE7, frame.data[0]);
}


TEST(BmpDecode, TwentyFourBitWithPadding) {
    // 2x2, each row is 6 bytes of BGR plus 2 bytes padding
    std::vector<uint8_t> bmp = makeBmp(2, 2, 24, {},
                                       {{0, 0, 255,   0, 255, 0,   0, 0},      // red, green
                                        {255, 0, 0,   255, 255, 255,   0, 0}}); // blue, white

    DecodedImage image;
    ASSERT_EQ(ESP_OK, bmpDecode(bmp.data(), bmp.size(), &image));
    EXPECT_EQ(PIXEL_BGR888, image.format);
    EXPECT_EQ(std::vector<uint8_t>({0, 0, 255,   0, 255, 0,
                                    255, 0, 0,   255, 255, 255}), image.pixels);

    // Red and blue are dark, green and white are light
    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 2}, 128, false, &frame));
    EXPECT_EQ(std::vector<uint8_t>({0x0F, 0x0F}), frame.data);
}


TEST(BmpDecode, ThirtyTwoBitRgb) {
    // Black, then white with a zero fourth byte
    std::vector<uint8_t> bmp = makeBmp(2, 1, 32, {}, {{0, 0, 0, 255,   255, 255, 255, 0}});

    DecodedImage image;
    ASSERT_EQ(ESP_OK, bmpDecode(bmp.data(), bmp.size(), &image));
    EXPECT_EQ(PIXEL_BGRA8888, image.format);
    EXPECT_EQ(8u, image.pixels.size());

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 1}, 128, false, &frame));
    EXPECT_EQ(0x0F, frame.data[0]);
}


TEST(BmpDecode, BitfieldsWithStandardMasks) {
    // The three masks sit where a palette would, right after the info header
    std::vector<uint8_t> masks(12, 0);
    std::vector<uint8_t> bmp = makeBmp(2, 1, 32, masks, {{0, 0, 0, 0,   255, 255, 255, 0}});
    put32(bmp, 30, 3);          // BI_BITFIELDS
    put32(bmp, 54, 0x00FF0000);
    put32(bmp, 58, 0x0000FF00);
    put32(bmp, 62, 0x000000FF);

    DecodedImage image;
    ASSERT_EQ(ESP_OK, bmpDecode(bmp.data(), bmp.size(), &image));
    EXPECT_EQ(PIXEL_BGRA8888, image.format);

    Bitmap frame;
    ASSERT_EQ(ESP_OK, frameEncode(image, PanelGeometry{8, 1}, 128, false, &frame));
    EXPECT_EQ(0x0F, frame.data[0]);

    // Red and blue swapped
    put32(bmp, 54, 0x000000FF);
    put32(bmp, 62, 0x00FF0000);
    EXPECT_EQ(ESP_ERR_NOT_SUPPORTED, bmpDecode(bmp.data(), bmp.size(), &image));

    // 5:6:5 on 16-bit
    put16(bmp, 28, 16);
    put32(bmp, 54, 0xF800);
    put32(bmp, 58, 0x07E0);
    put32(bmp, 62, 0x001F);
    EXPECT_EQ(ESP_ERR_NOT_SUPPORTED, bmpDecode(bmp.data(), bmp.size(), &image));
}


TEST(BmpDecode, ColourPaletteKeepsColours) {
    const std::vector<uint8_t> palette = {
        0x00, 0x00, 0xFF, 0x00,     // red
        0xFF, 0xFF, 0xFF, 0x00      // white
    };
    std::vector<uint8_t> bmp = makeBmp(2, 1, 8, palette, {{0, 1, 0, 0}});

    DecodedImage image;
    ASSERT_EQ(ESP_OK, bmpDecode(bmp.data(), bmp.size(), &image));
    EXPECT_EQ(PIXEL_INDEXED8, image.format);
    EXPECT_EQ(std::vector<uint8_t>({0, 1}), image.pixels);
    EXPECT_EQ(std::vector<uint8_t>({255, 0, 0, 255, 255, 255}), image.palette);
}


TEST(BmpDecode, RejectsTruncatedPixelData) {
    std::vector<uint8_t> bmp = makeBmp(8, 2, 1, MONO_PALETTE,
                                       {{0x0F, 0, 0, 0}, {0xFF, 0, 0, 0}});
    bmp.resize(bmp.size() - 3);

    DecodedImage image;
    EXPECT_EQ(ESP_ERR_INVALID_SIZE, bmpDecode(bmp.data(), bmp.size(), &image));
}


TEST(BmpDecode, RejectsInfoHeaderPastEndOfFile) {
    std::vector<uint8_t> bmp = makeBmp(8, 1, 1, MONO_PALETTE, {{0xFF, 0, 0, 0}});
    DecodedImage image;

    // Would wrap the palette offset on a 32-bit size_t
    put32(bmp, 14, 0xFFFFFFF0);
    EXPECT_EQ(ESP_ERR_INVALID_SIZE, bmpDecode(bmp.data(), bmp.size(), &image));

    Bitmap frame;
    FrameEncoder encoder(PANEL, 128, false, &frame);
    EXPECT_EQ(ESP_ERR_INVALID_SIZE, bmpStream(bmp.data(), bmp.size(), &encoder));

    // One byte too long
    put32(bmp, 14, (uint32_t)(bmp.size() - 14 + 1));
    EXPECT_EQ(ESP_ERR_INVALID_SIZE, bmpDecode(bmp.data(), bmp.size(), &image));

    // Exactly up to the end leaves no room for the palette
    put32(bmp, 14, (uint32_t)(bmp.size() - 14));
    EXPECT_EQ(ESP_ERR_INVALID_SIZE, bmpDecode(bmp.data(), bmp.size(), &image));
}


TEST(BmpDecode, RejectsCompressionAndOddDepths) {
    std::vector<uint8_t> bmp = makeBmp(8, 1, 1, MONO_PALETTE, {{0xFF, 0, 0, 0}});
    DecodedImage image;

    put32(bmp, 30, 1);  // BI_RLE8
    EXPECT_EQ(ESP_ERR_NOT_SUPPORTED, bmpDecode(bmp.data(), bmp.size(), &image));

    put32(bmp, 30, 0);
    put16(bmp, 28, 16);
    EXPECT_EQ(ESP_ERR_NOT_SUPPORTED, bmpDecode(bmp.data(), bmp.size(), &image));
}


TEST(BmpDecode, RejectsNonBmp) {
    const uint8_t png[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    DecodedImage image;

    EXPECT_FALSE(bmpIsBitmap(png, sizeof(png)));
    EXPECT_EQ(ESP_ERR_INVALID_ARG, bmpDecode(png, sizeof(png), &image));
    EXPECT_EQ(ESP_ERR_INVALID_ARG, bmpDecode(nullptr, 0, &image));
}


TEST(BmpStream, MatchesDecodeThenEncode) {
    std::vector<uint8_t> bmp = makeBmp(2, 2, 24, {},
                                       {{0, 0, 255,   0, 255, 0,   0, 0},
                                        {255, 0, 0,   255, 255, 255,   0, 0}});

    DecodedImage image;
    ASSERT_EQ(ESP_OK, bmpDecode(bmp.data(), bmp.size(), &image));
    Bitmap decoded;
    ASSERT_EQ(ESP_OK, frameEncode(image, PANEL, 128, true, &decoded));

    Bitmap streamed;
    FrameEncoder encoder(PANEL, 128, true, &streamed);
    ASSERT_EQ(ESP_OK, bmpStream(bmp.data(), bmp.size(), &encoder));
    EXPECT_EQ(decoded.data, streamed.data);
    EXPECT_EQ(2u, encoder.sourceWidth());
    EXPECT_EQ(2u, encoder.sourceHeight());
}
