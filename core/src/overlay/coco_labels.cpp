#include <overlay/coco_labels.hpp>

#include <array>
#include <cctype>
#include <cstdlib>

namespace ovs {
    namespace {
        constexpr std::array<const char*, 80> kCocoLabels = {
            "Person", "Bicycle", "Car", "Motorcycle", "Airplane", "Bus", "Train", "Truck", "Boat",
            "Traffic light", "Fire hydrant", "Stop sign", "Parking meter", "Bench", "Bird", "Cat",
            "Dog", "Horse", "Sheep", "Cow", "Elephant", "Bear", "Zebra", "Giraffe", "Backpack",
            "Umbrella", "Handbag", "Tie", "Suitcase", "Frisbee", "Skis", "Snowboard",
            "Sports ball", "Kite", "Baseball bat", "Baseball glove", "Skateboard", "Surfboard",
            "Tennis racket", "Bottle", "Wine glass", "Cup", "Fork", "Knife", "Spoon", "Bowl",
            "Banana", "Apple", "Sandwich", "Orange", "Broccoli", "Carrot", "Hot dog", "Pizza",
            "Donut", "Cake", "Chair", "Couch", "Potted plant", "Bed", "Dining table", "Toilet",
            "TV", "Laptop", "Mouse", "Remote", "Keyboard", "Cell phone", "Microwave", "Oven",
            "Toaster", "Sink", "Refrigerator", "Book", "Clock", "Vase", "Scissors", "Teddy bear",
            "Hair drier", "Toothbrush"
        };

        bool parse_class_id(const std::string& s, int& out) {
            if (s.empty()) return false;
            for (char c : s) {
                if (!std::isdigit(static_cast<unsigned char>(c)) && c != '-') return false;
            }
            char* end = nullptr;
            const long v = std::strtol(s.c_str(), &end, 10);
            if (end == s.c_str() || *end != '\0') return false;
            out = static_cast<int>(v);
            return true;
        }
    } // namespace

    const char* coco_label(int class_id) {
        if (class_id < 0 || class_id >= static_cast<int>(kCocoLabels.size())) return nullptr;
        return kCocoLabels[static_cast<size_t>(class_id)];
    }

    std::string resolve_coco_label(const std::string& label,
                                   const std::optional<std::string>& label_text) {
        if (label_text && !label_text->empty()) return *label_text;

        int id = 0;
        if (!parse_class_id(label, id)) return label;

        const char* name = coco_label(id);
        if (!name) return "Unknown (" + label + ")";
        return name;
    }
}
