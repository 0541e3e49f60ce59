#include "vision/core/contentDetector.hpp"

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

namespace gridscale::vision::core {
namespace gtest {

static void expectBox(const ContentResult& r, int xMin, int yMin, int xMax, int yMax) {
	ASSERT_TRUE(r.box.has_value());
	EXPECT_EQ(r.box->xMin, xMin);
	EXPECT_EQ(r.box->yMin, yMin);
	EXPECT_EQ(r.box->xMax, xMax);
	EXPECT_EQ(r.box->yMax, yMax);
}

TEST(ContentDetector, BlankImage_NoContent) {
	for (const int value: {0, 60, 200, 255}) {
		const cv::Mat blank(300, 400, CV_8UC3, cv::Scalar::all(value));

		const ContentResult r = detectContent(blank);
		EXPECT_EQ(r.strategy, ContentStrategy::FullDetection);
		EXPECT_FALSE(r.box.has_value()) << "value=" << value;
	}
}

TEST(ContentDetector, DarkShapeOnLightBackground) {
	cv::Mat image(300, 400, CV_8UC3, cv::Scalar(255, 255, 255));
	cv::rectangle(image, cv::Rect(100, 50, 100, 100), cv::Scalar(0, 0, 0), cv::FILLED);

	const ContentResult r = detectContent(image);
	expectBox(r, 100, 50, 200, 150);
	EXPECT_EQ(r.box->width(), 100);
	EXPECT_EQ(r.box->height(), 100);
}

TEST(ContentDetector, LightShapeOnDarkBackground) {
	cv::Mat image(300, 400, CV_8UC1, cv::Scalar(10));
	cv::rectangle(image, cv::Rect(40, 60, 120, 80), cv::Scalar(230), cv::FILLED);

	expectBox(detectContent(image), 40, 60, 160, 140);
}

TEST(ContentDetector, UnionOfShapes) {
	cv::Mat image(300, 400, CV_8UC3, cv::Scalar(255, 255, 255));
	cv::rectangle(image, cv::Rect(20, 30, 80, 60), cv::Scalar(0, 0, 0), cv::FILLED);
	cv::rectangle(image, cv::Rect(250, 200, 100, 50), cv::Scalar(40, 40, 40), cv::FILLED);

	expectBox(detectContent(image), 20, 30, 350, 250);
}

TEST(ContentDetector, SmallSpecksIgnored) {
	cv::Mat image(300, 400, CV_8UC3, cv::Scalar(255, 255, 255));
	cv::rectangle(image, cv::Rect(5, 5, 10, 10), cv::Scalar(0, 0, 0), cv::FILLED); // < 1% of the image
	cv::rectangle(image, cv::Rect(150, 100, 100, 100), cv::Scalar(0, 0, 0), cv::FILLED);

	expectBox(detectContent(image), 150, 100, 250, 200);

	cv::Mat specksOnly(300, 400, CV_8UC3, cv::Scalar(255, 255, 255));
	cv::rectangle(specksOnly, cv::Rect(5, 5, 10, 10), cv::Scalar(0, 0, 0), cv::FILLED);
	cv::rectangle(specksOnly, cv::Rect(300, 200, 12, 8), cv::Scalar(0, 0, 0), cv::FILLED);
	EXPECT_FALSE(detectContent(specksOnly).box.has_value());
}

TEST(ContentDetector, AlphaChannelInput) {
	cv::Mat image(300, 400, CV_8UC4, cv::Scalar(255, 255, 255, 255));
	cv::rectangle(image, cv::Rect(100, 50, 100, 100), cv::Scalar(0, 0, 0, 255), cv::FILLED);

	expectBox(detectContent(image), 100, 50, 200, 150);
}

TEST(ContentDetector, DegradedFallback_FixedMargins) {
	const cv::Mat image(300, 500, CV_8UC3, cv::Scalar(255, 255, 255));

	ContentDetectionConfig config{};
	config.strategy = ContentStrategy::DegradedFallback;

	const ContentResult r = detectContent(image, config);
	EXPECT_EQ(r.strategy, ContentStrategy::DegradedFallback);
	expectBox(r, 50, 30, 450, 270);
}

TEST(ContentDetector, UnsupportedInput_NoContent) {
	const cv::Mat twoChannels(100, 100, CV_8UC2, cv::Scalar(0, 255));
	EXPECT_FALSE(detectContent(twoChannels).box.has_value());
	EXPECT_FALSE(detectContent(cv::Mat{}).box.has_value());
}

TEST(ContentDetector, DebugStageRecordsContours) {
	cv::Mat image(300, 500, CV_8UC3, cv::Scalar(255, 255, 255));
	cv::rectangle(image, cv::Rect(50, 40, 120, 80), cv::Scalar(0, 0, 0), cv::FILLED);
	cv::rectangle(image, cv::Rect(300, 150, 100, 100), cv::Scalar(0, 0, 0), cv::FILLED);
	cv::circle(image, cv::Point(250, 20), 2, cv::Scalar(0, 0, 0), cv::FILLED); // Speck.

	DebugVisualizer debugger;
	const ContentResult r = detectContent(image, ContentDetectionConfig{}, &debugger);
	ASSERT_TRUE(r.box.has_value());

	ASSERT_EQ(debugger.stages().size(), 1u);
	const DebugStage& stage = debugger.stages()[0];
	EXPECT_EQ(stage.name, "Detect Content");
	ASSERT_EQ(stage.notes.size(), 2u);
	EXPECT_EQ(stage.notes[0].key, "contours");
	EXPECT_EQ(stage.notes[0].value, 3.0);
	EXPECT_EQ(stage.notes[1].key, "significant");
	EXPECT_EQ(stage.notes[1].value, 2.0);
	EXPECT_EQ(stage.steps.back().name, "Content Box");
}

} // namespace gtest
} // namespace gridscale::vision::core
