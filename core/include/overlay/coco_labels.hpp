#pragma once

#include <optional>
#include <string>

namespace ovs {
    // COCO-80 class name for a detector class id, nullptr when out of range.
    const char* coco_label(int class_id);

    // Prefers label_text, then the COCO name for numeric labels. Non-numeric labels
    // pass through; numeric ids outside the table become "Unknown (<id>)".
    std::string resolve_coco_label(const std::string& label,
                                   const std::optional<std::string>& label_text);
}
