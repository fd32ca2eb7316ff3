#include <gtest/gtest.h>
#include <sstream>
#include <thread>

#include "Grid/headers/GridSheet.h"
#include "Grid/headers/GridErrors.h"

TEST(GridSheetTest, OleColorEncoding) {
    EXPECT_EQ(toOleColor(0x12, 0x34, 0x56), 0x563412u);
    EXPECT_EQ(fromOleColor(0x563412u), (Rgb{0x12, 0x34, 0x56}));
}

TEST(GridSheetTest, StoresColorsAtAddresses) {
    std::ostringstream view;
    GridSheet sheet(view);
    sheet.prepare(TargetSize{2, 3});

    sheet.setCellColor(CellAddress{"C", 2}, 10, 20, 30);
    EXPECT_EQ(sheet.cellColor(CellAddress{"C", 2}), toOleColor(10, 20, 30));
    EXPECT_FALSE(sheet.cellColor(CellAddress{"A", 1}).has_value());
    EXPECT_EQ(sheet.writesAccepted(), 1u);
}

TEST(GridSheetTest, OutOfRangeAddressIsCellWriteError) {
    std::ostringstream view;
    GridSheet sheet(view);
    sheet.prepare(TargetSize{2, 3});

    EXPECT_THROW(sheet.setCellColor(CellAddress{"D", 1}, 0, 0, 0), CellWriteError);
    EXPECT_THROW(sheet.setCellColor(CellAddress{"A", 3}, 0, 0, 0), CellWriteError);
    EXPECT_THROW(sheet.setCellColor(CellAddress{"A", 0}, 0, 0, 0), CellWriteError);
    EXPECT_THROW(sheet.setCellColor(CellAddress{"a1", 1}, 0, 0, 0), CellWriteError);
    EXPECT_EQ(sheet.writesAccepted(), 0u);
}

TEST(GridSheetTest, CallsBeforePrepareAreFatal) {
    std::ostringstream view;
    GridSheet sheet(view);
    EXPECT_THROW(sheet.setCellColor(CellAddress{"A", 1}, 0, 0, 0), SinkFatalError);
    EXPECT_THROW(sheet.present(), SinkFatalError);
}

TEST(GridSheetTest, ForeignThreadIsRejected) {
    std::ostringstream view;
    GridSheet sheet(view);
    sheet.prepare(TargetSize{1, 1});
    EXPECT_FALSE(sheet.isThreadSafe());

    bool rejected = false;
    std::thread other([&]() {
        try {
            sheet.setCellColor(CellAddress{"A", 1}, 1, 2, 3);
        } catch (const SinkFatalError &) {
            rejected = true;
        }
    });
    other.join();
    EXPECT_TRUE(rejected);
    EXPECT_FALSE(sheet.cellColor(CellAddress{"A", 1}).has_value());
}

TEST(GridSheetTest, EmptyTargetIsSinkUnavailable) {
    std::ostringstream view;
    GridSheet sheet(view);
    EXPECT_THROW(sheet.prepare(TargetSize{0, 5}), SinkUnavailableError);
}

TEST(GridSheetTest, HugeTargetIsSinkUnavailable) {
    std::ostringstream view;
    GridSheet sheet(view);
    // 1048576 x 16384 cells need 64 GB
    EXPECT_THROW(sheet.prepare(TargetSize{1048576, 16384}), SinkUnavailableError);
}

TEST(GridSheetTest, ClearFormattingReleasesJournalButKeepsColors) {
    std::ostringstream view;
    GridSheet sheet(view);
    sheet.prepare(TargetSize{3, 2});
    for (uint32_t row = 1; row <= 3; ++row) {
        sheet.setCellColor(CellAddress{"A", row}, 1, 1, 1);
        sheet.setCellColor(CellAddress{"B", row}, 2, 2, 2);
    }
    EXPECT_EQ(sheet.journalSize(), 6u);

    sheet.clearFormatting(1, 2);
    EXPECT_EQ(sheet.journalSize(), 2u);
    EXPECT_EQ(sheet.journalRecordsCleared(), 4u);
    EXPECT_EQ(sheet.cellColor(CellAddress{"B", 1}), toOleColor(2, 2, 2));

    sheet.clearFormatting(3, 2); // empty range
    EXPECT_EQ(sheet.journalSize(), 2u);
}

TEST(GridSheetTest, FinalizeLayoutSizesCellsAndLocksShapes) {
    std::ostringstream view;
    GridSheet sheet(view);
    sheet.addShape("Picture 1");
    sheet.addShape("Comment 1");
    sheet.prepare(TargetSize{2, 2});
    sheet.finalizeLayout();

    EXPECT_DOUBLE_EQ(sheet.columnWidth(), 2.0);
    EXPECT_DOUBLE_EQ(sheet.rowHeight(), GridSheet::columnWidthToPoints(2.0));
    ASSERT_EQ(sheet.shapes().size(), 2u);
    for (const auto &shape: sheet.shapes()) {
        EXPECT_TRUE(shape.lock_aspect_ratio);
    }
}

TEST(GridSheetTest, PresentDrawsWithTrueColorAndZoomsToFit) {
    std::ostringstream view;
    GridSheet sheet(view, 10);
    sheet.prepare(TargetSize{4, 40});
    sheet.setCellColor(CellAddress{"A", 1}, 255, 0, 0);
    sheet.present();

    EXPECT_TRUE(sheet.isVisible());
    // 40 columns in a 10 character view: 4 cells per character
    EXPECT_EQ(sheet.zoom(), 25);
    EXPECT_NE(view.str().find("\033[38;2;255;0;0m"), std::string::npos);
}

TEST(GridSheetTest, ZoomHasLowerBound) {
    std::ostringstream view;
    GridSheet sheet(view, 1);
    sheet.prepare(TargetSize{1, 200});
    sheet.present();
    EXPECT_EQ(sheet.zoom(), GridSheet::MIN_ZOOM);
}

TEST(GridSheetTest, LowerHalfOnlyUsesLowerBlockOnDefaultBackground) {
    std::ostringstream view;
    GridSheet sheet(view, 10);
    sheet.prepare(TargetSize{2, 1});
    sheet.setCellColor(CellAddress{"A", 2}, 0, 128, 255);
    sheet.present();

    const std::string out = view.str();
    EXPECT_NE(out.find("\033[38;2;0;128;255m\033[49m▄"), std::string::npos);
    EXPECT_EQ(out.find("▀"), std::string::npos);
    EXPECT_EQ(out.find("\033[48;2;"), std::string::npos);
}

TEST(GridSheetTest, BothHalvesUseUpperBlock) {
    std::ostringstream view;
    GridSheet sheet(view, 10);
    sheet.prepare(TargetSize{2, 1});
    sheet.setCellColor(CellAddress{"A", 1}, 1, 2, 3);
    sheet.setCellColor(CellAddress{"A", 2}, 4, 5, 6);
    sheet.present();

    EXPECT_NE(view.str().find("\033[38;2;1;2;3m\033[48;2;4;5;6m▀"), std::string::npos);
}
