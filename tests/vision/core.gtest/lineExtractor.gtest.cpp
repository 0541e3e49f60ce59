#include "vision/core/lineExtractor.hpp"

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

#include <vector>

namespace gridscale::vision::core {
namespace gtest {

TEST(LineExtractor, SegmentLength) {
	EXPECT_DOUBLE_EQ(segmentLength({0, 0, 3, 4}), 5.0);
	EXPECT_DOUBLE_EQ(segmentLength({10, 10, 10, 60}), 50.0);
	EXPECT_DOUBLE_EQ(segmentLength({7, 7, 7, 7}), 0.0);
}

TEST(LineExtractor, DropShortSegments_KeepsOrderAndBoundary) {
	const std::vector<cv::Vec4i> segments = {
	        {0, 0, 100, 0},  // 100
	        {0, 10, 30, 10}, // 30
	        {5, 0, 5, 50},   // exactly 50
	        {0, 0, 30, 39},  // ~49.2
	        {0, 20, 0, 80},  // 60
	};

	const std::vector<cv::Vec4i> kept = dropShortSegments(segments, 50.0);
	ASSERT_EQ(kept.size(), 3u);
	EXPECT_EQ(kept[0], segments[0]);
	EXPECT_EQ(kept[1], segments[2]);
	EXPECT_EQ(kept[2], segments[4]);
}

TEST(LineExtractor, ExtractLines_IsFilteredRawOutput) {
	cv::Mat image(300, 300, CV_8UC1, cv::Scalar(255));
	for (int p = 30; p < 300; p += 60) {
		cv::line(image, cv::Point(p, 0), cv::Point(p, 299), cv::Scalar(0));
		cv::line(image, cv::Point(0, p), cv::Point(299, p), cv::Scalar(0));
	}
	cv::line(image, cv::Point(100, 100), cv::Point(130, 110), cv::Scalar(0), 2); // Short stroke.

	const LineExtractionConfig config{};
	const std::vector<cv::Vec4i> raw   = detectSegments(image, config);
	const std::vector<cv::Vec4i> lines = extractLines(image, config);

	EXPECT_GE(raw.size(), lines.size());
	EXPECT_EQ(lines, dropShortSegments(raw, config.houghMinLineLength));
	for (const auto& l: lines)
		EXPECT_GE(segmentLength(l), config.houghMinLineLength);
}

TEST(LineExtractor, ConvertToGray_Depths) {
	cv::Mat gray;

	const cv::Mat wide(4, 4, CV_16UC1, cv::Scalar(65535));
	ASSERT_TRUE(convertToGray(wide, gray));
	EXPECT_EQ(gray.type(), CV_8UC1);
	EXPECT_EQ(gray.at<unsigned char>(0, 0), 255);

	cv::Mat ramp(1, 3, CV_32FC1);
	ramp.at<float>(0, 0) = -1.f;
	ramp.at<float>(0, 1) = 0.f;
	ramp.at<float>(0, 2) = 1.f;
	ASSERT_TRUE(convertToGray(ramp, gray));
	EXPECT_EQ(gray.type(), CV_8UC1);
	EXPECT_EQ(gray.at<unsigned char>(0, 0), 0);
	EXPECT_EQ(gray.at<unsigned char>(0, 2), 255);

	EXPECT_FALSE(convertToGray(cv::Mat(4, 4, CV_8UC2), gray));
}

} // namespace gtest
} // namespace gridscale::vision::core
