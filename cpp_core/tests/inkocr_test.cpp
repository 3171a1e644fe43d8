#include <gtest/gtest.h>
#include "fake_models.hpp"
#include "inkocr.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

TEST(InkOCRTest, RecognizesTwoWordsOnOneLine) {
    FakeRecognitionModel model(ScoresForA(0.9f));
    InkOCR ocr(model, TestCharset());

    OcrResult result = ocr.Run(PageWithGlyphs(TwoWordLine()));
    EXPECT_EQ(result.text, "aa aa");
    EXPECT_NEAR(result.confidence, 0.9f, 1e-5);
    ASSERT_EQ(result.spans.size(), 2u);
    EXPECT_EQ(result.spans[0].text, "aa");
    EXPECT_EQ(result.spans[0].box, GlyphBox::FromBounds(18, 39, 72, 71));
    EXPECT_EQ(result.spans[1].box, GlyphBox::FromBounds(128, 39, 182, 71));
    EXPECT_EQ(model.calls(), 4);
}

TEST(InkOCRTest, BlankPageNeverCallsTheModel) {
    FakeRecognitionModel model(ScoresForA(0.9f));
    InkOCR ocr(model, TestCharset());

    Outcome<OcrResult> outcome = ocr.Process(cv::Mat(120, 240, CV_8UC3, cv::Scalar(255, 255, 255)));
    EXPECT_TRUE(outcome.empty());

    OcrResult result = ocr.Run(cv::Mat(120, 240, CV_8UC3, cv::Scalar(255, 255, 255)));
    EXPECT_EQ(result.text, "");
    EXPECT_FLOAT_EQ(result.confidence, 0.0f);
    EXPECT_TRUE(result.spans.empty());
    EXPECT_EQ(model.calls(), 0);
}

TEST(InkOCRTest, RepeatedRunsGiveIdenticalResults) {
    FakeRecognitionModel model(ScoresForA(0.9f));
    InkOCR ocr(model, TestCharset());
    cv::Mat page = PageWithGlyphs(TwoWordLine());

    OcrResult first = ocr.Run(page);
    OcrResult second = ocr.Run(page);
    EXPECT_EQ(first.text, second.text);
    EXPECT_FLOAT_EQ(first.confidence, second.confidence);
    ASSERT_EQ(first.spans.size(), second.spans.size());
    for (size_t i = 0; i < first.spans.size(); ++i) EXPECT_EQ(first.spans[i].box, second.spans[i].box);
}

TEST(InkOCRTest, GlyphsBelowMinConfidenceAreDropped) {
    FakeRecognitionModel model(ScoresForA(0.2f));
    InkOCR ocr(model, TestCharset());

    Outcome<OcrResult> outcome = ocr.Process(PageWithGlyphs(TwoWordLine()));
    EXPECT_TRUE(outcome.empty());
    EXPECT_EQ(model.calls(), 4);
}

TEST(InkOCRTest, ModelErrorsNeverEscapeRun) {
    FakeRecognitionModel model([](const cv::Mat&, int) -> ScoreMatrix {
        throw std::runtime_error("session run failed");
    });
    InkOCR ocr(model, TestCharset());

    OcrResult result;
    EXPECT_NO_THROW(result = ocr.Run(PageWithGlyphs(TwoWordLine())));
    EXPECT_EQ(result.text, "");
    EXPECT_TRUE(result.spans.empty());
}

TEST(InkOCRTest, FailedGlyphIsSkippedAndTheRestKept) {
    FakeRecognitionModel model([](const cv::Mat&, int call) -> ScoreMatrix {
        if (call == 0) throw std::runtime_error("session run failed");
        return ScoresForA(0.9f);
    });
    InkOCR ocr(model, TestCharset());

    OcrResult result = ocr.Run(PageWithGlyphs(TwoWordLine()));
    EXPECT_EQ(result.text, "a aa");
    ASSERT_EQ(result.spans.size(), 2u);
    EXPECT_FLOAT_EQ(result.spans[0].box.min_x(), 48.0f);
}

TEST(InkOCRTest, NonStandardModelErrorSkipsOnlyThatGlyph) {
    struct SessionError {};
    FakeRecognitionModel model([](const cv::Mat&, int call) -> ScoreMatrix {
        if (call == 0) throw SessionError();
        return ScoresForA(0.9f);
    });
    InkOCR ocr(model, TestCharset());

    OcrResult result;
    EXPECT_NO_THROW(result = ocr.Run(PageWithGlyphs(TwoWordLine())));
    EXPECT_EQ(result.text, "a aa");
    EXPECT_EQ(model.calls(), 4);
}

TEST(InkOCRTest, NoGroupingReportsEveryGlyph) {
    FakeRecognitionModel model(ScoresForA(0.9f));
    OcrConfig config;
    config.grouping = GroupingStrategy::kNone;
    InkOCR ocr(model, TestCharset(), config);

    OcrResult result = ocr.Run(PageWithGlyphs(TwoWordLine()));
    EXPECT_EQ(result.text, "a a a a");
    EXPECT_EQ(result.spans.size(), 4u);
}

TEST(InkOCRTest, DilationGroupingFindsTheSameWords) {
    FakeRecognitionModel model(ScoresForA(0.9f));
    OcrConfig config;
    config.grouping = GroupingStrategy::kDilation;
    InkOCR ocr(model, TestCharset(), config);

    OcrResult result = ocr.Run(PageWithGlyphs(TwoWordLine()));
    EXPECT_EQ(result.text, "aa aa");
    ASSERT_EQ(result.spans.size(), 2u);
    EXPECT_LT(result.spans[0].box.min_x(), result.spans[1].box.min_x());
}

TEST(InkOCRTest, ConfidenceMergingLeavesConfidentWordsAlone) {
    FakeRecognitionModel model(ScoresForA(0.9f));
    OcrConfig config;
    config.confidence_merging = true;
    InkOCR ocr(model, TestCharset(), config);
    EXPECT_EQ(ocr.Run(PageWithGlyphs(TwoWordLine())).text, "aa aa");
}

TEST(InkOCRTest, RawRgbaBufferMatchesMatInput) {
    FakeRecognitionModel model(ScoresForA(0.9f));
    InkOCR ocr(model, TestCharset());
    cv::Mat page = PageWithGlyphs(TwoWordLine());
    cv::Mat rgba;
    cv::cvtColor(page, rgba, cv::COLOR_BGR2RGBA);

    OcrResult result = ocr.Run(rgba.data, rgba.cols, rgba.rows, static_cast<int>(rgba.step), PixelFormat::kRgba);
    EXPECT_EQ(result.text, "aa aa");
    EXPECT_EQ(result.spans.size(), 2u);
}

TEST(InkOCRTest, InvalidConfigIsRejected) {
    FakeRecognitionModel model(ScoresForA(0.9f));
    OcrConfig config;
    config.min_confidence = 1.5f;
    EXPECT_THROW({ InkOCR ocr(model, TestCharset(), config); }, std::invalid_argument);
}

TEST(InkOCRTest, RunOcrBuildsAOneShotPipeline) {
    FakeRecognitionModel model(ScoresForA(0.9f));
    OcrResult result = RunOcr(PageWithGlyphs(TwoWordLine()), OcrConfig::Handwriting(), model, TestCharset());
    EXPECT_EQ(result.text, "aa aa");
}
