// command_file.cpp
// Parse rasterizer command files into typed commands

#include "command_file.h"
#include <SDL.h>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

// =============================================================================
// Token helpers
// =============================================================================

static bool toInt(const std::string& token, int& out) {
    if (token.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(token.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

static bool toDouble(const std::string& token, double& out) {
    if (token.empty()) {
        return false;
    }
    char* end = nullptr;
    double value = std::strtod(token.c_str(), &end);
    if (*end != '\0') {
        return false;
    }
    out = value;
    return true;
}

// Read exactly n integer arguments
static bool readInts(const std::vector<std::string>& args, size_t n, std::vector<int>& out) {
    if (args.size() != n) {
        return false;
    }
    for (const auto& arg : args) {
        int value = 0;
        if (!toInt(arg, value)) {
            return false;
        }
        out.push_back(value);
    }
    return true;
}

// Read a group size followed by values, dropping an incomplete last group
static bool readGroups(const std::vector<std::string>& args, int maxGroup, Command& out) {
    if (args.empty()) {
        return false;
    }
    int groupSize = 0;
    if (!toInt(args[0], groupSize) || groupSize < 1 || groupSize > maxGroup) {
        return false;
    }

    size_t valueCount = args.size() - 1;
    size_t usable = valueCount - valueCount % static_cast<size_t>(groupSize);
    for (size_t i = 0; i < usable; i++) {
        double value = 0.0;
        if (!toDouble(args[i + 1], value)) {
            return false;
        }
        out.values.push_back(value);
    }
    out.integers.push_back(groupSize);
    return true;
}

// =============================================================================
// Line parser
// =============================================================================

ParseResult parseCommandLine(const std::string& line, int lineNumber, Command& out) {
    std::istringstream stream(line);
    std::string keyword;
    if (!(stream >> keyword) || keyword[0] == '#') {
        return ParseResult::Ignored;
    }

    std::vector<std::string> args;
    std::string token;
    while (stream >> token) {
        args.push_back(token);
    }

    out = Command();
    out.line = lineNumber;
    bool ok = true;

    if (keyword == "png") {
        out.type = CommandType::Png;
        ok = args.size() == 3;
        if (ok) {
            std::vector<std::string> size(args.begin(), args.begin() + 2);
            ok = readInts(size, 2, out.integers) && out.integers[0] > 0 && out.integers[1] > 0;
            out.path = args[2];
        }
    } else if (keyword == "depth") {
        out.type = CommandType::Depth;
    } else if (keyword == "sRGB") {
        out.type = CommandType::Srgb;
    } else if (keyword == "hyp") {
        out.type = CommandType::Hyperbolic;
    } else if (keyword == "cull") {
        out.type = CommandType::Cull;
    } else if (keyword == "frustum") {
        out.type = CommandType::Frustum;
    } else if (keyword == "fsaa") {
        out.type = CommandType::Fsaa;
        ok = readInts(args, 1, out.integers) && out.integers[0] >= 1;
    } else if (keyword == "texture") {
        out.type = CommandType::Texture;
        ok = args.size() == 1;
        if (ok) {
            out.path = args[0];
        }
    } else if (keyword == "uniformMatrix") {
        out.type = CommandType::UniformMatrix;
        ok = args.size() == 16;
        for (size_t i = 0; ok && i < args.size(); i++) {
            double value = 0.0;
            ok = toDouble(args[i], value);
            out.values.push_back(value);
        }
    } else if (keyword == "position") {
        out.type = CommandType::Position;
        ok = readGroups(args, 4, out);
    } else if (keyword == "color") {
        out.type = CommandType::Color;
        ok = readGroups(args, 4, out);
    } else if (keyword == "texcoord") {
        out.type = CommandType::TexCoord;
        ok = readGroups(args, 2, out);
    } else if (keyword == "pointsize") {
        out.type = CommandType::PointSize;
        ok = readGroups(args, 1, out);
    } else if (keyword == "elements") {
        out.type = CommandType::Elements;
        ok = readInts(args, args.size(), out.integers);
    } else if (keyword == "drawArraysTriangles") {
        out.type = CommandType::DrawArraysTriangles;
        ok = readInts(args, 2, out.integers);
    } else if (keyword == "drawElementsTriangles") {
        out.type = CommandType::DrawElementsTriangles;
        ok = readInts(args, 2, out.integers);
    } else if (keyword == "drawArraysPoints") {
        out.type = CommandType::DrawArraysPoints;
        ok = readInts(args, 2, out.integers);
    } else {
        return ParseResult::Ignored;
    }

    return ok ? ParseResult::Parsed : ParseResult::Malformed;
}

// =============================================================================
// File parser
// =============================================================================

bool parseCommandFile(const std::string& path, std::vector<Command>& commands) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Could not open command file %s", path.c_str());
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        lineNumber++;

        Command command;
        switch (parseCommandLine(line, lineNumber, command)) {
            case ParseResult::Parsed:
                commands.push_back(command);
                break;
            case ParseResult::Malformed:
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s:%d: malformed %s command, skipped",
                            path.c_str(), lineNumber, commandName(command.type));
                break;
            case ParseResult::Ignored:
                break;
        }
    }

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Parsed %zu commands from %s",
                 commands.size(), path.c_str());
    return true;
}

const char* commandName(CommandType type) {
    switch (type) {
        case CommandType::Png:                   return "png";
        case CommandType::Depth:                 return "depth";
        case CommandType::Srgb:                  return "sRGB";
        case CommandType::Hyperbolic:            return "hyp";
        case CommandType::Fsaa:                  return "fsaa";
        case CommandType::Cull:                  return "cull";
        case CommandType::Frustum:               return "frustum";
        case CommandType::Texture:               return "texture";
        case CommandType::UniformMatrix:         return "uniformMatrix";
        case CommandType::Position:              return "position";
        case CommandType::Color:                 return "color";
        case CommandType::TexCoord:              return "texcoord";
        case CommandType::PointSize:             return "pointsize";
        case CommandType::Elements:              return "elements";
        case CommandType::DrawArraysTriangles:   return "drawArraysTriangles";
        case CommandType::DrawElementsTriangles: return "drawElementsTriangles";
        case CommandType::DrawArraysPoints:      return "drawArraysPoints";
    }
    return "unknown";
}
