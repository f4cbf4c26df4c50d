#include "ObstacleSource.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace
{
    bool isAllDigits(const std::string &s)
    {
        return !s.empty() && std::all_of(s.begin(), s.end(),
                                         [](unsigned char c)
                                         { return std::isdigit(c) != 0; });
    }

    std::string trim(const std::string &s)
    {
        size_t begin = s.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
            return "";
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(begin, end - begin + 1);
    }
}

ObstacleSource ObstacleSource::parse(const std::string &option)
{
    std::string trimmed = trim(option);
    if (trimmed.empty())
        return none();

    if (isAllDigits(trimmed))
    {
        int count = 0;
        try
        {
            count = std::stoi(trimmed);
        }
        catch (const std::out_of_range &)
        {
            count = MAX_RANDOM_COUNT + 1;
        }
        if (count > MAX_RANDOM_COUNT)
            throw std::invalid_argument("blocks count is too large: " + trimmed + " (at most " +
                                        std::to_string(MAX_RANDOM_COUNT) + ")");
        return count > 0 ? random(count) : none();
    }

    // otherwise treat as file path
    if (!std::filesystem::is_regular_file(option))
        throw std::invalid_argument("blocks expects an integer or a JSON file path. Not found: " + option);

    std::ifstream file(option);
    if (!file.is_open())
        throw std::invalid_argument("Failed to read JSON file for blocks: " + option);

    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJsonText(buffer.str(), option);
}

ObstacleSource ObstacleSource::fromJsonText(const std::string &text, const std::string &path)
{
    const nlohmann::json data = nlohmann::json::parse(text, nullptr, false);
    if (data.is_discarded())
        throw std::invalid_argument("Failed to read JSON file for blocks: " + path + " is not valid JSON");

    auto blocksIt = data.is_object() ? data.find("blocks") : data.end();
    if (!data.is_object() || blocksIt == data.end() || !blocksIt->is_array())
        throw std::invalid_argument("Invalid JSON: expected an object with key 'blocks' containing a list.");

    static const char *REQUIRED[] = {"top", "left", "width", "height"};

    std::vector<Obstacle> canon;
    for (size_t i = 0; i < blocksIt->size(); ++i)
    {
        const auto &obj = (*blocksIt)[i];
        const std::string where = "blocks[" + std::to_string(i) + "]";
        if (!obj.is_object())
            throw std::invalid_argument("Invalid JSON: " + where + " is not an object.");

        for (const char *key : REQUIRED)
        {
            auto it = obj.find(key);
            if (it == obj.end())
                throw std::invalid_argument("Invalid JSON: " + where + " missing required key '" + key + "'.");
            if (!it->is_number_integer() || it->get<long long>() <= 0)
                throw std::invalid_argument("Invalid JSON: " + where + "." + key + " must be a positive integer.");
        }

        std::optional<std::string> color;
        auto colorIt = obj.find("color");
        if (colorIt != obj.end() && !colorIt->is_null())
        {
            if (!colorIt->is_string())
                throw std::invalid_argument("Invalid JSON: " + where + ".color must be a string if provided.");
            color = colorIt->get<std::string>();
        }

        // top/left/width/height -> x1,y1,x2,y2
        double x1 = static_cast<double>(obj["left"].get<long long>());
        double y1 = static_cast<double>(obj["top"].get<long long>());
        double x2 = x1 + static_cast<double>(obj["width"].get<long long>());
        double y2 = y1 + static_cast<double>(obj["height"].get<long long>());
        canon.push_back({x1, y1, x2, y2, color});
    }

    return fixed(std::move(canon), path);
}

ObstacleSource ObstacleSource::random(int count)
{
    ObstacleSource source;
    source.mode_ = Mode::Random;
    source.count_ = std::max(0, count);
    return source;
}

ObstacleSource ObstacleSource::fixed(std::vector<Obstacle> obstacles, std::string path)
{
    ObstacleSource source;
    source.mode_ = Mode::Fixed;
    source.count_ = static_cast<int>(obstacles.size());
    source.fixed_ = std::move(obstacles);
    source.path_ = std::move(path);
    return source;
}

void ObstacleSource::apply(ObstacleField &field, int width, int height, double radius, std::mt19937 &rng) const
{
    switch (mode_)
    {
    case Mode::Random:
        field.generateRandom(count_, width, height, radius, rng, DEFAULT_COLOR);
        break;
    case Mode::Fixed:
        field.applyFixed(fixed_, DEFAULT_COLOR);
        break;
    case Mode::None:
    default:
        field.clear();
        break;
    }
}

std::string ObstacleSource::describe() const
{
    switch (mode_)
    {
    case Mode::Random:
        return "random(" + std::to_string(count_) + ")";
    case Mode::Fixed:
        return "json:" + path_;
    case Mode::None:
    default:
        return "none";
    }
}
