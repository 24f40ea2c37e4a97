#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileRepository.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "TestFakes.hpp"

using namespace lyricflow;
namespace fs = std::filesystem;

namespace {

domain::SongMetadata Metadata(const std::string& id, const std::string& url) {
    domain::SongMetadata m;
    m.songId = id;
    m.title = "Title " + id;
    m.durationSeconds = 201.5;
    m.detectedLanguage = "hi";
    m.sourceUrl = url;
    m.createdAt = 1700000000.25;
    return m;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Storage Round-Trip Test..." << std::endl;

    auto root = test::MakeTestRoot("storage");
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    infrastructure::FileRepository repo((root / "songs").string(), (root / "library.json").string(), persistence);

    // Song assets
    auto segments = test::MakeSegments({{0.0, "pehla"}, {4.5, "doosra"}});
    segments[1].translated = "second";
    auto meta = Metadata("song-1", "https://youtu.be/abc");
    repo.saveSong(meta, segments);

    auto loaded = repo.findSegments("song-1");
    assert(loaded && loaded->size() == 2);
    assert((*loaded)[0].text == "pehla" && !(*loaded)[0].translated);
    assert((*loaded)[1].start == 4.5 && *(*loaded)[1].translated == "second");

    auto loadedMeta = repo.findMetadata("song-1");
    assert(loadedMeta && loadedMeta->title == "Title song-1");
    assert(loadedMeta->durationSeconds == 201.5 && loadedMeta->createdAt == 1700000000.25);

    auto raw = persistence->loadText((root / "songs" / "song-1" / "lyrics.json").string());
    auto doc = nlohmann::json::parse(*raw);
    assert(!doc[0].contains("translated"));
    assert(doc[1]["translated"] == "second");
    auto rawMeta = nlohmann::json::parse(*persistence->loadText((root / "songs" / "song-1" / "metadata.json").string()));
    assert(rawMeta["youtube_url"] == "https://youtu.be/abc");
    assert(rawMeta["detected_language"] == "hi");
    assert(rawMeta["duration"] == 201.5);
    std::cout << "[PASS] Song assets round-trip with the stored key names." << std::endl;

    // Catalog order and lookup
    assert(repo.loadLibrary().empty());
    repo.appendToLibrary(meta);
    repo.appendToLibrary(Metadata("song-2", "https://www.youtube.com/watch?v=xyz"));
    auto library = repo.loadLibrary();
    assert(library.size() == 2 && library[0].songId == "song-1" && library[1].songId == "song-2");
    assert(repo.findByUrl("https://www.youtube.com/watch?v=xyz")->songId == "song-2");
    assert(!repo.findByUrl("https://www.youtube.com/watch?v=other"));
    assert(!repo.findMetadata("missing"));
    assert(!repo.findSegments("../song-1"));
    std::cout << "[PASS] Catalog preserves insertion order and resolves URLs." << std::endl;

    // Malformed catalog entries are skipped
    {
        std::ofstream out(root / "library.json", std::ios::trunc);
        out << R"([{"song_id":"ok","youtube_url":"u1"},{"title":"no id"},42])";
    }
    library = repo.loadLibrary();
    assert(library.size() == 1 && library[0].songId == "ok" && library[0].title == "Unknown");
    {
        std::ofstream out(root / "library.json", std::ios::trunc);
        out << "{ not json";
    }
    assert(repo.loadLibrary().empty());
    std::cout << "[PASS] Corrupt catalog content tolerated." << std::endl;

    // Appending keeps entries this build cannot decode
    {
        std::ofstream out(root / "library.json", std::ios::trunc);
        out << R"([{"song_id":"a","youtube_url":"ua"},{"title":"no id","extra":1},{"song_id":"c","url":"uc"}])";
    }
    repo.appendToLibrary(Metadata("d", "ud"));
    auto kept = nlohmann::json::parse(*persistence->loadText((root / "library.json").string()));
    assert(kept.is_array() && kept.size() == 4);
    assert(kept[1]["title"] == "no id" && kept[1]["extra"] == 1);
    assert(kept[2]["song_id"] == "c" && kept[2]["url"] == "uc");
    assert(kept[3]["song_id"] == "d");
    std::cout << "[PASS] Append preserves undecodable catalog entries." << std::endl;

    // Appending to a damaged catalog fails and leaves it untouched
    for (const std::string damaged : {std::string(R"([{"song_id":"a","youtube_url":"ua"},)"),
                                      std::string(R"({"song_id":"a"})")}) {
        {
            std::ofstream out(root / "library.json", std::ios::trunc);
            out << damaged;
        }
        bool refused = false;
        try {
            repo.appendToLibrary(Metadata("e", "ue"));
        } catch (const std::runtime_error&) {
            refused = true;
        }
        assert(refused);
        assert(*persistence->loadText((root / "library.json").string()) == damaged);
    }
    std::cout << "[PASS] Damaged catalog is never overwritten." << std::endl;

    // Unsafe ids
    bool threw = false;
    try {
        repo.audioPath("..");
    } catch (const domain::NotFoundError&) {
        threw = true;
    }
    assert(threw);

    // No temp files left behind
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        assert(entry.path().extension() != ".tmp");
    }
    std::cout << "[PASS] Atomic writes leave no temp files." << std::endl;

    // Configuration
    {
        setenv("XDG_DATA_HOME", (root / "xdg").string().c_str(), 1);
        auto defaults = infrastructure::ConfigLoader::Load((root / "absent.json").string());
        assert(defaults.port == 8000);
        assert(defaults.targetTier == "large-v3");
        assert(defaults.threads >= 1);
        assert(fs::path(defaults.modelsDir) == root / "xdg" / "LyricFlow" / "models");
        assert(fs::is_directory(defaults.modelsDir));

        std::ofstream out(root / "settings.json");
        out << R"({"port": 9100, "data_dir": "/srv/lyrics", "model_tiers": ["base", "tiny"], "target_tier": "huge"})";
        out.close();
        auto config = infrastructure::ConfigLoader::Load((root / "settings.json").string());
        assert(config.port == 9100);
        assert(config.targetTier == "base");
        assert(fs::path(config.songsDir()) == fs::path("/srv/lyrics/songs"));
        assert(fs::path(config.libraryPath()) == fs::path("/srv/lyrics/library.json"));

        std::ofstream bad(root / "bad.json");
        bad << "{ port: }";
        bad.close();
        auto fallback = infrastructure::ConfigLoader::Load((root / "bad.json").string());
        assert(fallback.port == 8000);
        std::cout << "[PASS] Configuration defaults and overrides." << std::endl;
    }

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
