// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at https://mozilla.org/MPL/2.0/.

#include "DavBackup/Backup/AgentRegistry.h"
#include "DavBackup/Backup/BackupAgent.h"
#include "DavBackup/Core/ClientConfig.h"
#include "DavBackup/WebDAV/WebDAVUtils.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace std;
using namespace DavBackup;
using namespace DavBackup::Backup;

namespace {

// Reads a local archive in fixed-size pieces
class FileChunkSource : public Transfer::ChunkSource {
public:
    explicit FileChunkSource(const string& path) : _in(path, ios::binary) {}

    bool isOpen() const { return static_cast<bool>(_in); }

    Result<size_t> read(uint8_t* buffer, size_t size) override {
        if (_in.eof()) return Result<size_t>::ok(0);
        _in.read(reinterpret_cast<char*>(buffer), static_cast<streamsize>(size));
        if (_in.bad()) {
            return Result<size_t>::err(StorageError::IoFailure, "read error on local archive");
        }
        return Result<size_t>::ok(static_cast<size_t>(_in.gcount()));
    }

private:
    ifstream _in;
};

void usage(const char* argv0) {
    cerr << "Usage: " << argv0 << " <config.json> <command> [args]\n"
         << "Commands:\n"
         << "  check                          verify credentials and create the backup folder\n"
         << "  list                           list stored backups, newest first\n"
         << "  get <id>                       print one backup descriptor\n"
         << "  upload <id> <file> [name]      store a local archive as backup <id>\n"
         << "  download <id> <file>           restore backup <id> into a local file\n"
         << "  delete <id>                    delete backup <id>\n";
}

void printRecord(const BackupRecord& rec) {
    cout << rec.date << "  " << rec.backupId << "  " << rec.size << " bytes  "
         << rec.name << (rec.isProtected ? "  [protected]" : "") << endl;
}

int fail(const string& what) {
    cerr << "Error: " << what << endl;
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        usage(argv[0]);
        return 2;
    }

    auto cfg = loadClientConfig(argv[1]);
    if (cfg.failed()) {
        return fail(cfg.describe());
    }

    const string command = argv[2];
    if (command == "check") {
        auto r = AgentRegistry::verifyConnection(cfg.value);
        if (r.failed()) return fail(r.describe());
        cout << "Connection OK, backup folder " << cfg.value.backupPath << " is ready" << endl;
        return 0;
    }

    AgentRegistry registry;
    auto added = registry.addEntry("cli", cfg.value);
    if (added.failed()) {
        return fail(added.describe());
    }
    BackupAgent& agent = *added.value;

    if (command == "list") {
        auto backups = agent.listBackups();
        if (backups.failed()) return fail(backups.describe());
        for (const auto& rec : backups.value) {
            printRecord(rec);
        }
        cout << backups.value.size() << " backup(s)" << endl;
        return 0;
    }

    if (command == "get" && argc >= 4) {
        auto rec = agent.getBackup(argv[3]);
        if (rec.failed()) return fail(rec.describe());
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        cout << Json::writeString(builder, rec.value.toJson()) << endl;
        return 0;
    }

    if (command == "upload" && argc >= 5) {
        const string path = argv[4];
        BackupRecord rec;
        rec.backupId = argv[3];
        rec.name = argc >= 6 ? argv[5] : ("Backup " + rec.backupId);
        rec.date = WebDAV::Utils::formatIsoUtc(chrono::system_clock::now());

        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec) return fail("cannot read " + path + ": " + ec.message());
        rec.size = size;

        auto r = agent.uploadBackup(rec, [&path]() -> Result<unique_ptr<Transfer::ChunkSource>> {
            auto src = make_unique<FileChunkSource>(path);
            if (!src->isOpen()) {
                return Result<unique_ptr<Transfer::ChunkSource>>::err(StorageError::IoFailure, "cannot open " + path);
            }
            return Result<unique_ptr<Transfer::ChunkSource>>::ok(std::move(src));
        });
        if (r.failed()) return fail(r.describe());
        cout << "Uploaded " << rec.backupId << " (" << rec.size << " bytes)" << endl;
        return 0;
    }

    if (command == "download" && argc >= 5) {
        auto stream = agent.downloadBackup(argv[3]);
        if (stream.failed()) return fail(stream.describe());

        ofstream out(argv[4], ios::binary | ios::trunc);
        if (!out) return fail(string("cannot write ") + argv[4]);

        vector<uint8_t> chunk(256 * 1024);
        uint64_t total = 0;
        for (;;) {
            auto r = stream.value->read(chunk.data(), chunk.size());
            if (r.failed()) return fail(r.describe());
            if (r.value == 0) break;
            out.write(reinterpret_cast<const char*>(chunk.data()), static_cast<streamsize>(r.value));
            if (!out) return fail(string("write error on ") + argv[4]);
            total += r.value;
        }
        cout << "Downloaded " << total << " bytes to " << argv[4] << endl;
        return 0;
    }

    if (command == "delete" && argc >= 4) {
        auto r = agent.deleteBackup(argv[3]);
        if (r.failed()) return fail(r.describe());
        cout << "Deleted " << argv[3] << endl;
        return 0;
    }

    usage(argv[0]);
    return 2;
}
