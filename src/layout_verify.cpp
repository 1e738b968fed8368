#include "layout_verify.hpp"

#include "rich_text_layout.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

using namespace Kinetic;

bool Kinetic::verify_layout_centered(const RichTextLayout& layout, float tolerance) {
	if (layout.allChars.empty()) {
		return true;
	}

	auto minX = std::numeric_limits<double>::max();
	auto maxX = std::numeric_limits<double>::lowest();

	for (auto& chr : layout.allChars) {
		auto halfWidth = static_cast<double>(chr.width) * 0.5;
		minX = std::min(minX, chr.xPosition - halfWidth);
		maxX = std::max(maxX, chr.xPosition + halfWidth);
	}

	// Stored positions are floats, so their rounding grows with the extent of the line
	auto storageError = (maxX - minX) * LAYOUT_CENTER_RELATIVE_TOLERANCE;

	return std::abs((minX + maxX) * 0.5) <= tolerance + storageError;
}

bool Kinetic::verify_no_overlap(const RichTextLayout& layout, float tolerance) {
	std::vector<const LayoutChar*> sorted;
	sorted.reserve(layout.allChars.size());

	for (auto& chr : layout.allChars) {
		sorted.push_back(&chr);
	}

	std::stable_sort(sorted.begin(), sorted.end(), [](auto* a, auto* b) {
		return a->xPosition < b->xPosition;
	});

	for (size_t i = 1; i < sorted.size(); ++i) {
		auto rightEdge = sorted[i - 1]->xPosition + sorted[i - 1]->width * 0.5f;
		auto leftEdge = sorted[i]->xPosition - sorted[i]->width * 0.5f;

		if (rightEdge > leftEdge + tolerance) {
			return false;
		}
	}

	return true;
}

bool Kinetic::verify_segment_order(const RichTextLayout& layout) {
	std::vector<const SegmentLayout*> sorted;
	sorted.reserve(layout.segments.size());

	for (auto& segment : layout.segments) {
		sorted.push_back(&segment);
	}

	std::stable_sort(sorted.begin(), sorted.end(), [](auto* a, auto* b) {
		return a->segmentIndex < b->segmentIndex;
	});

	for (size_t i = 1; i < sorted.size(); ++i) {
		if (sorted[i]->startX < sorted[i - 1]->startX) {
			return false;
		}
	}

	return true;
}
