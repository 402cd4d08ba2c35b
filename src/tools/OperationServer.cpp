#include "tools/OperationServer.h"
#include "utils/ProcessRunner.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

std::string stringArg(const nlohmann::json& args, const char* name) {
    auto it = args.find(name);
    if (it == args.end() || !it->is_string()) {
        throw OperationError(ErrorKind::InvalidRequest,
            std::string("Missing or non-string parameter '") + name + "'");
    }
    return it->get<std::string>();
}

ErrorKind kindFromErrorCode(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory) return ErrorKind::NotFound;
    if (ec == std::errc::file_exists) return ErrorKind::AlreadyExists;
    if (ec == std::errc::not_a_directory) return ErrorKind::NotADirectory;
    if (ec == std::errc::is_a_directory) return ErrorKind::NotAFile;
    return ErrorKind::Unknown;
}

std::string trimTrailing(std::string text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    return text;
}

std::vector<fs::directory_entry> sortedEntries(const fs::path& dir) {
    std::vector<fs::directory_entry> entries;
    for (const auto& entry : fs::directory_iterator(dir)) {
        entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
        return a.path().filename() < b.path().filename();
    });
    return entries;
}

// Global options allowed in front of the subcommand. Everything else is
// refused: -C, --git-dir and --work-tree point the VCS elsewhere, and -c,
// --config-env or --exec-path can set aliases, hooks or programs that run
// outside the project directory.
const std::set<std::string>& allowedGlobalOptions() {
    static const std::set<std::string> allowed = {
        "--no-pager", "-P", "--version", "-v", "--help", "-h",
        "--no-replace-objects", "--literal-pathspecs", "--glob-pathspecs",
        "--noglob-pathspecs", "--icase-pathspecs", "--no-optional-locks"
    };
    return allowed;
}

// First global option before the subcommand that is not allowed, or "".
std::string findDisallowedOption(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        if (arg.empty() || arg[0] != '-') break;
        if (allowedGlobalOptions().count(arg) == 0) return arg;
    }
    return "";
}

} // namespace

OperationServer::OperationServer(const std::string& rootPath, std::chrono::milliseconds timeout)
    : guard(rootPath), timeout(timeout) {
    registerHandlers();
}

void OperationServer::registerHandlers() {
    handlers[OperationKind::ListFiles] = [this](const nlohmann::json& a) {
        return listFiles(stringArg(a, "path"));
    };
    handlers[OperationKind::ReadFile] = [this](const nlohmann::json& a) {
        return readFile(stringArg(a, "path"));
    };
    handlers[OperationKind::WriteFile] = [this](const nlohmann::json& a) {
        return writeFile(stringArg(a, "path"), stringArg(a, "content"));
    };
    handlers[OperationKind::AppendFile] = [this](const nlohmann::json& a) {
        return appendFile(stringArg(a, "path"), stringArg(a, "content"));
    };
    handlers[OperationKind::MoveFile] = [this](const nlohmann::json& a) {
        return moveFile(stringArg(a, "source"), stringArg(a, "destination"));
    };
    handlers[OperationKind::DeleteFile] = [this](const nlohmann::json& a) {
        return deleteFile(stringArg(a, "path"));
    };
    handlers[OperationKind::CreateDirectory] = [this](const nlohmann::json& a) {
        return createDirectory(stringArg(a, "path"));
    };
    handlers[OperationKind::DeleteDirectory] = [this](const nlohmann::json& a) {
        return deleteDirectory(stringArg(a, "path"));
    };
    handlers[OperationKind::ListDirectoryTree] = [this](const nlohmann::json& a) {
        return listDirectoryTree(stringArg(a, "path"));
    };
    handlers[OperationKind::ReadDirectoryFiles] = [this](const nlohmann::json& a) {
        return readDirectoryFiles(stringArg(a, "path"));
    };
    handlers[OperationKind::RunVcsCommand] = [this](const nlohmann::json& a) {
        return runVcsCommand(stringArg(a, "command"));
    };
    handlers[OperationKind::GetWorkingDirectory] = [this](const nlohmann::json&) {
        return getWorkingDirectory();
    };
}

OperationResult OperationServer::execute(const OperationRequest& request) {
    auto it = handlers.find(request.kind);
    if (it == handlers.end()) {
        return OperationResult::failure(ErrorKind::InvalidRequest,
            "No handler registered for operation: " + toString(request.kind));
    }

    const nlohmann::json& args = request.arguments;
    if (!args.is_object()) {
        return OperationResult::failure(ErrorKind::InvalidRequest, "Arguments must be a JSON object");
    }

    auto wd = args.find("working_directory");
    if (wd != args.end()) {
        bool sameRoot = false;
        if (wd->is_string()) {
            fs::path given = fs::u8path(wd->get<std::string>());
            if (given.is_relative()) given = guard.root() / given;
            std::error_code ec;
            fs::path canonicalGiven = fs::weakly_canonical(given, ec);
            sameRoot = !ec && canonicalGiven == guard.root();
        }
        if (!sameRoot) {
            return OperationResult::failure(ErrorKind::AccessDenied,
                "Path access denied: working directory " + wd->dump() + " is not the project directory.");
        }
    }

    try {
        return it->second(args);
    } catch (const OperationError& e) {
        return OperationResult::failure(e.getKind(), e.what());
    }
}

OperationResult OperationServer::guarded(const std::function<OperationResult(const Deadline&)>& body) {
    Deadline deadline(timeout);
    try {
        return body(deadline);
    } catch (const PathAccessDenied& e) {
        return OperationResult::failure(ErrorKind::AccessDenied, e.what());
    } catch (const OperationError& e) {
        return OperationResult::failure(e.getKind(), e.what());
    } catch (const fs::filesystem_error& e) {
        return OperationResult::failure(kindFromErrorCode(e.code()), e.what());
    } catch (const std::exception& e) {
        return OperationResult::failure(ErrorKind::Unknown, e.what());
    }
}

// ---------------------- File System ----------------------

OperationResult OperationServer::listFiles(const std::string& path) {
    return guarded([&](const Deadline& deadline) {
        fs::path dir = guard.resolve(path);
        if (!fs::exists(dir)) {
            throw OperationError(ErrorKind::NotFound, "Path does not exist: '" + path + "'");
        }
        if (!fs::is_directory(dir)) {
            throw OperationError(ErrorKind::NotADirectory, "Path is not a directory: '" + path + "'");
        }

        std::vector<std::string> names;
        for (const auto& entry : fs::directory_iterator(dir)) {
            deadline.check("list_files '" + path + "'");
            names.push_back(entry.path().filename().u8string());
        }
        if (names.empty()) {
            return OperationResult::success("Directory is empty.");
        }
        std::sort(names.begin(), names.end());

        std::string listing;
        for (const auto& name : names) {
            if (!listing.empty()) listing += "\n";
            listing += name;
        }
        return OperationResult::success(listing);
    });
}

OperationResult OperationServer::readFile(const std::string& path) {
    return guarded([&](const Deadline& deadline) {
        fs::path file = guard.resolve(path);
        if (!fs::exists(file)) {
            throw OperationError(ErrorKind::NotFound, "File does not exist: '" + path + "'");
        }
        if (!fs::is_regular_file(file)) {
            throw OperationError(ErrorKind::NotAFile, "Path is not a file: '" + path + "'");
        }
        return OperationResult::success(readContent(file, deadline));
    });
}

OperationResult OperationServer::writeFile(const std::string& path, const std::string& content) {
    return guarded([&](const Deadline& deadline) {
        fs::path file = guard.resolve(path);
        if (fs::is_directory(file)) {
            throw OperationError(ErrorKind::NotAFile, "Path is a directory: '" + path + "'");
        }
        fs::create_directories(file.parent_path());
        writeContent(file, content, false, deadline);
        return OperationResult::success("Successfully wrote to '" + path + "'.");
    });
}

OperationResult OperationServer::appendFile(const std::string& path, const std::string& content) {
    return guarded([&](const Deadline& deadline) {
        fs::path file = guard.resolve(path);
        if (fs::is_directory(file)) {
            throw OperationError(ErrorKind::NotAFile, "Path is a directory: '" + path + "'");
        }
        fs::create_directories(file.parent_path());
        writeContent(file, content, true, deadline);
        return OperationResult::success("Successfully appended to '" + path + "'.");
    });
}

OperationResult OperationServer::moveFile(const std::string& source, const std::string& destination) {
    return guarded([&](const Deadline&) {
        // The leaf is not followed: a link is moved, not its target.
        fs::path from = guard.resolveParent(source);
        if (!fs::exists(fs::symlink_status(from))) {
            throw OperationError(ErrorKind::NotFound, "Source does not exist: '" + source + "'");
        }
        if (from == guard.root()) {
            throw OperationError(ErrorKind::AccessDenied, "Path access denied: cannot move the project directory itself.");
        }

        fs::path to = guard.resolveParent(destination);
        fs::path parent = to.parent_path();
        if (!fs::exists(parent)) {
            throw OperationError(ErrorKind::NotFound, "Destination directory does not exist for '" + destination + "'");
        }
        if (!fs::is_directory(parent)) {
            throw OperationError(ErrorKind::NotADirectory, "Destination parent is not a directory for '" + destination + "'");
        }
        if (fs::exists(fs::symlink_status(to))) {
            throw OperationError(ErrorKind::AlreadyExists, "Destination already exists: '" + destination + "'");
        }

        fs::rename(from, to);
        return OperationResult::success("Successfully moved '" + source + "' to '" + destination + "'.");
    });
}

OperationResult OperationServer::deleteFile(const std::string& path) {
    return guarded([&](const Deadline&) {
        // A link is removed itself, never the file it points to.
        fs::path file = guard.resolveParent(path);
        fs::file_status status = fs::symlink_status(file);
        if (!fs::exists(status)) {
            throw OperationError(ErrorKind::NotFound, "File does not exist: '" + path + "'");
        }
        if (!fs::is_symlink(status) && !fs::is_regular_file(status)) {
            throw OperationError(ErrorKind::NotAFile, "Path is not a file: '" + path + "'");
        }
        fs::remove(file);
        return OperationResult::success("Successfully deleted file '" + path + "'.");
    });
}

OperationResult OperationServer::createDirectory(const std::string& path) {
    return guarded([&](const Deadline&) {
        fs::path dir = guard.resolve(path);
        if (fs::exists(dir) && !fs::is_directory(dir)) {
            throw OperationError(ErrorKind::AlreadyExists, "A file already exists at '" + path + "'");
        }
        fs::create_directories(dir);
        return OperationResult::success("Successfully created directory '" + path + "'.");
    });
}

OperationResult OperationServer::deleteDirectory(const std::string& path) {
    return guarded([&](const Deadline& deadline) {
        fs::path dir = guard.resolve(path);
        if (dir == guard.root()) {
            throw OperationError(ErrorKind::AccessDenied,
                "Path access denied: refusing to delete the project directory itself.");
        }
        if (!fs::exists(dir)) {
            throw OperationError(ErrorKind::NotFound, "Directory does not exist: '" + path + "'");
        }
        if (!fs::is_directory(dir)) {
            throw OperationError(ErrorKind::NotADirectory, "Path is not a directory: '" + path + "'");
        }
        removeTree(dir, deadline);
        return OperationResult::success("Successfully deleted directory '" + path + "' and all its contents.");
    });
}

OperationResult OperationServer::listDirectoryTree(const std::string& path) {
    return guarded([&](const Deadline& deadline) {
        fs::path dir = guard.resolve(path);
        if (!fs::exists(dir)) {
            throw OperationError(ErrorKind::NotFound, "Path does not exist: '" + path + "'");
        }
        if (!fs::is_directory(dir)) {
            throw OperationError(ErrorKind::NotADirectory, "Path is not a directory: '" + path + "'");
        }

        std::string name = dir.filename().u8string();
        std::string tree = (name.empty() ? dir.u8string() : name) + "/";
        std::set<fs::path> ancestors;
        buildTree(dir, 1, ancestors, tree, deadline);
        return OperationResult::success(tree);
    });
}

OperationResult OperationServer::readDirectoryFiles(const std::string& path) {
    return guarded([&](const Deadline& deadline) {
        fs::path dir = guard.resolve(path);
        if (!fs::exists(dir)) {
            throw OperationError(ErrorKind::NotFound, "Path does not exist: '" + path + "'");
        }
        if (!fs::is_directory(dir)) {
            throw OperationError(ErrorKind::NotADirectory, "Path is not a directory: '" + path + "'");
        }

        nlohmann::json files = nlohmann::json::object();
        for (const auto& entry : sortedEntries(dir)) {
            deadline.check("read_directory_files '" + path + "'");
            if (!fs::is_regular_file(entry.status())) continue;

            // A link may lead out of the root even though its name is inside.
            std::error_code ec;
            fs::path target = fs::canonical(entry.path(), ec);
            if (ec || !guard.contains(target)) continue;
            if (fs::file_size(target) > kMaxReadBytes) continue;

            files[entry.path().filename().u8string()] = readContent(target, deadline);
        }

        if (files.empty()) {
            return OperationResult::success({{"info", "No readable files found in directory."}});
        }
        return OperationResult::success(files);
    });
}

OperationResult OperationServer::getWorkingDirectory() {
    return OperationResult::success(guard.root().u8string());
}

// ---------------------- Version Control ----------------------

OperationResult OperationServer::runVcsCommand(const std::string& command) {
    std::vector<std::string> args;
    try {
        args = splitCommandLine(command);
    } catch (const OperationError& e) {
        return OperationResult::failure(e.getKind(), e.what());
    }
    return runVcs(args);
}

OperationResult OperationServer::runVcs(const std::vector<std::string>& args) {
    return guarded([&](const Deadline& deadline) {
        std::string disallowed = findDisallowedOption(args);
        if (!disallowed.empty()) {
            throw OperationError(ErrorKind::AccessDenied,
                "Path access denied: global option '" + disallowed + "' is not permitted; it could act outside the project directory.");
        }

        std::vector<std::string> argv;
        argv.push_back(vcsProgram);
        argv.insert(argv.end(), args.begin(), args.end());

        // No credential prompts and no discovery of repositories above the root.
        std::vector<std::string> env = {
            "GIT_TERMINAL_PROMPT=0",
            "GIT_CEILING_DIRECTORIES=" + guard.root().parent_path().u8string()
        };

        ProcessResult proc = ProcessRunner::run(argv, guard.root(), deadline, env);
        if (proc.timedOut) {
            std::string shown;
            for (const auto& a : args) shown += (shown.empty() ? "" : " ") + a;
            throw OperationError(ErrorKind::Timeout,
                "Operation timed out after " + std::to_string(timeout.count()) + "ms: " +
                vcsProgram + " " + shown);
        }

        return OperationResult::success({
            {"stdout", trimTrailing(proc.output)},
            {"stderr", trimTrailing(proc.error)},
            {"return_code", proc.spawnFailed ? 127 : proc.exitCode}
        });
    });
}

std::vector<std::string> OperationServer::splitCommandLine(const std::string& command) {
    std::vector<std::string> words;
    std::string current;
    bool inWord = false;

    for (std::size_t i = 0; i < command.size(); ++i) {
        char c = command[i];
        if (c == '\'') {
            std::size_t end = command.find('\'', i + 1);
            if (end == std::string::npos) {
                throw OperationError(ErrorKind::Unknown, "Unterminated single quote in command: " + command);
            }
            current.append(command, i + 1, end - i - 1);
            inWord = true;
            i = end;
        } else if (c == '"') {
            bool closed = false;
            for (++i; i < command.size(); ++i) {
                char d = command[i];
                if (d == '"') {
                    closed = true;
                    break;
                }
                if (d == '\\' && i + 1 < command.size() &&
                    (command[i + 1] == '"' || command[i + 1] == '\\' ||
                     command[i + 1] == '$' || command[i + 1] == '`')) {
                    current += command[++i];
                } else {
                    current += d;
                }
            }
            if (!closed) {
                throw OperationError(ErrorKind::Unknown, "Unterminated double quote in command: " + command);
            }
            inWord = true;
        } else if (c == '\\') {
            if (i + 1 < command.size()) current += command[++i];
            inWord = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (inWord) {
                words.push_back(current);
                current.clear();
                inWord = false;
            }
        } else {
            current += c;
            inWord = true;
        }
    }
    if (inWord) words.push_back(current);
    return words;
}

// ---------------------- Helpers ----------------------

std::string OperationServer::readContent(const fs::path& path, const Deadline& deadline) {
    std::uintmax_t size = fs::file_size(path);
    if (size > kMaxReadBytes) {
        throw OperationError(ErrorKind::Unknown,
            "File is too large to read (" + std::to_string(size) + " bytes, limit " +
            std::to_string(kMaxReadBytes) + ")");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open file for reading: " + path.u8string());
    }

    std::string content;
    content.reserve(static_cast<std::size_t>(size));
    std::vector<char> buffer(kChunkSize);
    while (in) {
        deadline.check("reading " + path.filename().u8string());
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        content.append(buffer.data(), static_cast<std::size_t>(in.gcount()));
    }
    if (in.bad()) {
        throw std::runtime_error("Read error on " + path.u8string());
    }
    return content;
}

void OperationServer::writeContent(const fs::path& path, const std::string& content, bool append,
                                   const Deadline& deadline) {
    std::ofstream out(path, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path.u8string());
    }
    for (std::size_t offset = 0; offset < content.size(); offset += kChunkSize) {
        deadline.check("writing " + path.filename().u8string());
        std::size_t len = std::min(kChunkSize, content.size() - offset);
        out.write(content.data() + offset, static_cast<std::streamsize>(len));
        if (!out) {
            throw std::runtime_error("Write error on " + path.u8string());
        }
    }
}

void OperationServer::removeTree(const fs::path& path, const Deadline& deadline) {
    deadline.check("delete_directory");
    // symlink_status: a link to a directory is removed, never followed.
    if (fs::is_directory(fs::symlink_status(path))) {
        std::vector<fs::path> children;
        for (const auto& entry : fs::directory_iterator(path)) {
            children.push_back(entry.path());
        }
        for (const auto& child : children) {
            removeTree(child, deadline);
        }
    }
    fs::remove(path);
}

void OperationServer::buildTree(const fs::path& dir, int depth, std::set<fs::path>& ancestors,
                                std::string& out, const Deadline& deadline) {
    fs::path canonicalDir = fs::canonical(dir);
    if (!ancestors.insert(canonicalDir).second) {
        throw OperationError(ErrorKind::Unknown,
            "Symbolic link cycle detected: '" + guard.relative(dir) + "' leads back to '" +
            guard.relative(canonicalDir) + "'");
    }

    std::string indent(static_cast<std::size_t>(depth) * 4, ' ');
    for (const auto& entry : sortedEntries(dir)) {
        deadline.check("list_directory_tree");
        std::string name = entry.path().filename().u8string();

        if (!fs::is_directory(entry.status())) {
            out += "\n" + indent + name;
            continue;
        }

        out += "\n" + indent + name + "/";
        if (entry.is_symlink()) {
            std::error_code ec;
            fs::path target = fs::canonical(entry.path(), ec);
            if (ec || !guard.contains(target)) continue;  // listed, not entered
        }
        buildTree(entry.path(), depth + 1, ancestors, out, deadline);
    }

    ancestors.erase(canonicalDir);
}
