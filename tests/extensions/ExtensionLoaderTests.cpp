#include <dimensions/extensions/ExtensionManager.hpp>
#include <dimensions/extensions/ExtensionSource.hpp>
#include <dimensions/extensions/ModuleLoader.hpp>
#include <dimensions/protocol/Packets.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace ext = dimensions::extensions;
namespace fs = std::filesystem;

namespace {

std::string g_moduleDir;

class NullContext final : public dimensions::handlers::IClientContext {
  public:
    std::uint64_t clientId() const noexcept override { return 1; }
    std::uint16_t listenPort() const noexcept override { return 7777; }
    const std::string &playerName() const noexcept override { return name_; }
    void setPlayerName(std::string name) override { name_ = std::move(name); }
    std::string currentDestination() const override { return {}; }
    bool sendToClient(std::vector<std::uint8_t>) override { return true; }
    bool sendToBackend(std::vector<std::uint8_t>) override { return true; }
    bool requestTransfer(const std::string &) override { return false; }
    void disconnect(std::string_view) override {}

  private:
    std::string name_;
};

fs::path makeTempDir(const std::string &tag) {
    const auto dir =
        fs::temp_directory_path() / ("dimensions_" + tag + "_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

/// 빌드된 packet_stats 모듈을 디렉터리에서 찾아 열고 info 를 읽습니다.
bool test_directory_loads_packet_stats() {
    auto loader = std::make_shared<ext::DlModuleLoader>();
    auto source = std::make_shared<ext::DirectoryExtensionSource>(g_moduleDir, loader);
    ext::ExtensionManager manager(source, loader);

    auto list = manager.loadAll();
    if (list.size() != 1) {
        std::cerr << "[dir] loaded " << list.size() << " extensions from '" << g_moduleDir
                  << "'\n";
        return false;
    }

    const auto &loaded = list[0];
    if (loaded.info.name != "PacketStats" || !loaded.info.reloadable ||
        loaded.info.reloadName.value_or("") != "packetstats") {
        std::cerr << "[dir] unexpected info name='" << loaded.info.name << "'\n";
        return false;
    }
    if (!loaded.clientHook || loaded.backendHook) {
        std::cerr << "[dir] hook capabilities not cached as expected\n";
        return false;
    }

    NullContext ctx;
    auto packet = dimensions::protocol::makePacket(dimensions::protocol::buildPlayerInfo(0, "x"));
    if (loaded.clientHook->onPacket(ctx, packet) != dimensions::protocol::PacketVerdict::Forward) {
        std::cerr << "[dir] stats hook dropped a packet\n";
        return false;
    }

    if (manager.passOnReload(list, "packetstats") != 1) {
        std::cerr << "[dir] pass-through did not reach the module\n";
        return false;
    }

    manager.unloadAll(list);
    return list.empty();
}

/// 없는 디렉터리는 빈 목록, 깨진 .so 는 건너뜁니다.
bool test_missing_and_broken_modules_skipped() {
    auto loader = std::make_shared<ext::DlModuleLoader>();

    ext::DirectoryExtensionSource missing("/nonexistent/dimensions/extensions", loader);
    if (!missing.discover().empty()) {
        std::cerr << "[broken] missing directory produced extensions\n";
        return false;
    }

    const auto dir = makeTempDir("broken_ext");
    {
        std::ofstream junk(dir / "junk.so");
        junk << "not an ELF file";
        std::ofstream text(dir / "readme.txt");
        text << "ignored";
    }

    ext::DirectoryExtensionSource broken(dir.string(), loader);
    const auto found = broken.discover();
    fs::remove_all(dir);

    if (!found.empty()) {
        std::cerr << "[broken] junk module was loaded\n";
        return false;
    }
    return true;
}

class FailingLoader final : public ext::IModuleLoader {
  public:
    std::shared_ptr<ext::LoadedModule> open(const std::string &path) override {
        ++calls;
        throw std::runtime_error("cannot open " + path);
    }
    int calls{0};
};

/// 로더가 던져도 discover 는 던지지 않습니다.
bool test_loader_failure_is_logged_not_thrown() {
    auto loader = std::make_shared<FailingLoader>();
    ext::DirectoryExtensionSource source(g_moduleDir, loader);
    try {
        if (!source.discover().empty()) {
            std::cerr << "[loader] failing loader produced extensions\n";
            return false;
        }
    } catch (const std::exception &e) {
        std::cerr << "[loader] discover threw: " << e.what() << "\n";
        return false;
    }
    return loader->calls >= 1;
}

class ScriptedExtension final : public ext::IExtension {
  public:
    ScriptedExtension(std::string name, bool reloadable, bool withReloadName, bool throwOnLoad,
                      bool throwOnReload)
        : name_(std::move(name)), reloadable_(reloadable), withReloadName_(withReloadName),
          throwOnLoad_(throwOnLoad), throwOnReload_(throwOnReload) {}

    ext::ExtensionInfo info() const override {
        ext::ExtensionInfo i{name_, "0.1", reloadable_, std::nullopt};
        if (withReloadName_) {
            i.reloadName = name_;
        }
        return i;
    }
    void onLoad() override {
        if (throwOnLoad_) {
            throw std::runtime_error("bad config");
        }
        ++loads;
    }
    void onUnload() override { ++unloads; }
    void reload(ext::IModuleLoader &, std::string_view command) override {
        if (throwOnReload_) {
            throw std::runtime_error("reload failed");
        }
        lastCommand.assign(command);
    }

    int loads{0};
    int unloads{0};
    std::string lastCommand;

  private:
    std::string name_;
    bool reloadable_;
    bool withReloadName_;
    bool throwOnLoad_;
    bool throwOnReload_;
};

/// onLoad 가 던진 extension 은 빠지고, pass-through 는 reloadable + reloadName 만 부릅니다.
bool test_manager_load_cycle_and_pass_through() {
    auto good = std::make_shared<ScriptedExtension>("good", true, true, false, false);
    auto noName = std::make_shared<ScriptedExtension>("noname", true, false, false, false);
    auto fixed = std::make_shared<ScriptedExtension>("fixed", false, true, false, false);
    auto failing = std::make_shared<ScriptedExtension>("failing", true, true, true, false);
    auto throwing = std::make_shared<ScriptedExtension>("throwing", true, true, false, true);

    auto source = std::make_shared<ext::StaticExtensionSource>([&]() {
        return std::vector<std::shared_ptr<ext::IExtension>>{good, noName, fixed, failing,
                                                             throwing};
    });
    ext::ExtensionManager manager(source, std::make_shared<ext::DlModuleLoader>());

    auto list = manager.loadAll();
    if (list.size() != 4) {
        std::cerr << "[manager] loaded " << list.size() << " (expected 4)\n";
        return false;
    }
    for (const auto &l : list) {
        if (l.info.name == "failing") {
            std::cerr << "[manager] failing extension kept\n";
            return false;
        }
    }

    // 명령 이름은 비교하지 않고 전부에게 넘긴다
    const auto called = manager.passOnReload(list, "somecommand");
    if (called != 1 || good->lastCommand != "somecommand" || !noName->lastCommand.empty() ||
        !fixed->lastCommand.empty()) {
        std::cerr << "[manager] pass-through called=" << called << "\n";
        return false;
    }

    manager.reloadAll(list);
    if (good->unloads != 1 || good->loads != 2 || list.size() != 4) {
        std::cerr << "[manager] reloadAll cycle mismatch loads=" << good->loads
                  << " unloads=" << good->unloads << "\n";
        return false;
    }

    manager.unloadAll(list);
    return list.empty() && good->unloads == 2;
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << "usage: ExtensionLoaderTests <module-dir>\n";
        return 1;
    }
    g_moduleDir = argv[1];

    bool ok = true;

    ok = ok && test_directory_loads_packet_stats();
    ok = ok && test_missing_and_broken_modules_skipped();
    ok = ok && test_loader_failure_is_logged_not_thrown();
    ok = ok && test_manager_load_cycle_and_pass_through();

    if (!ok) {
        std::cerr << "ExtensionLoader tests FAILED\n";
        return 1;
    }

    std::cout << "ExtensionLoader tests PASSED\n";
    return 0;
}
