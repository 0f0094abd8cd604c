// =================================================================
// tests/BackupManagerTest.cpp
// =================================================================
// Unit tests for BackupManager operations.

#include "SafeBackup/BackupManager.hpp"
#include "SafeBackup/BackupError.hpp"
#include "SafeBackup/Logger.hpp"
#include "TestWorkspace.hpp"
#include <iostream>
#include <cassert>
#include <functional>

class BackupManagerTest {
private:
    SafeBackup::ErrorKind expectError(const std::function<void()>& operation) {
        try {
            operation();
        } catch (const SafeBackup::BackupError& e) {
            return e.kind();
        }
        assert(false && "Expected BackupError");
        return SafeBackup::ErrorKind::IO_FAILURE;
    }

public:
    void testBackupCreatesBothArtifacts() {
        std::cout << "Testing backup artifacts..." << std::endl;

        TestWorkspace ws("manager_backup");
        ws.write("notes.md", "# Notes\nline two\n");

        SafeBackup::BackupManager manager(ws.context(1000));
        auto path = manager.createBackup("notes.md");

        assert(path == ws.path("notes.md.1000.bak"));
        assert(ws.read("notes.md.1000.bak") == "# Notes\nline two\n");
        assert(ws.read("notes.bak") == "# Notes\nline two\n");
        assert(ws.read("notes.md") == "# Notes\nline two\n");

        std::cout << "✓ Backup artifacts test passed" << std::endl;
    }

    void testSecondBackupOverwritesPlainOnly() {
        std::cout << "Testing repeated backups..." << std::endl;

        TestWorkspace ws("manager_repeat");
        ws.write("data.csv", "first");

        SafeBackup::BackupManager first(ws.context(100));
        first.createBackup("data.csv");

        ws.write("data.csv", "second");
        SafeBackup::BackupManager second(ws.context(200));
        second.createBackup("data.csv");

        assert(ws.read("data.csv.100.bak") == "first");
        assert(ws.read("data.csv.200.bak") == "second");
        assert(ws.read("data.bak") == "second");

        std::cout << "✓ Repeated backups test passed" << std::endl;
    }

    void testBackupOfBakFile() {
        std::cout << "Testing backup of a file already named .bak..." << std::endl;

        TestWorkspace ws("manager_bakfile");
        ws.write("x.bak", "payload");

        SafeBackup::BackupManager manager(ws.context(7));
        manager.createBackup("x.bak");

        assert(ws.read("x.bak.7.bak") == "payload");
        assert(ws.read("x.bak") == "payload");

        std::cout << "✓ Backup of .bak file test passed" << std::endl;
    }

    void testBackupErrors() {
        std::cout << "Testing backup errors..." << std::endl;

        TestWorkspace ws("manager_backup_errors");
        SafeBackup::BackupManager manager(ws.context());

        assert(expectError([&] { manager.createBackup("missing.txt"); }) == SafeBackup::ErrorKind::NOT_FOUND);
        assert(expectError([&] { manager.createBackup("../x.txt"); }) == SafeBackup::ErrorKind::INVALID_INPUT);
        assert(expectError([&] { manager.createBackup("   "); }) == SafeBackup::ErrorKind::INVALID_INPUT);
        assert(ws.fileCount() == 0 && "Failed operations must not log or create files");

        std::cout << "✓ Backup errors test passed" << std::endl;
    }

    void testRoundTripByOriginalName() {
        std::cout << "Testing backup then restore by original name..." << std::endl;

        TestWorkspace ws("manager_roundtrip");
        std::string binary("\x00\x01\xff\n\r\x7f", 6);
        ws.write("blob.bin", binary);

        SafeBackup::BackupManager manager(ws.context(500));
        manager.createBackup("blob.bin");

        ws.write("blob.bin", "corrupted");
        auto restored = manager.restoreFile("blob.bin");

        assert(restored == ws.path("blob.bin"));
        assert(ws.read("blob.bin") == binary);

        std::cout << "✓ Round trip test passed" << std::endl;
    }

    void testRestoreFromPlainBackupName() {
        std::cout << "Testing restore from the plain backup name..." << std::endl;

        TestWorkspace ws("manager_restore_plain");
        ws.write("report.bak", "saved");

        SafeBackup::BackupManager manager(ws.context(1700000000));
        auto restored = manager.restoreFile("report.bak");

        assert(restored == ws.path("report.restored.1700000000"));
        assert(ws.read("report.restored.1700000000") == "saved");
        assert(ws.read("report.bak") == "saved");

        std::cout << "✓ Plain restore test passed" << std::endl;
    }

    void testDelete() {
        std::cout << "Testing delete..." << std::endl;

        TestWorkspace ws("manager_delete");
        ws.write("old.log", "bye");

        SafeBackup::BackupManager manager(ws.context());
        manager.deleteFile("old.log");
        assert(!ws.exists("old.log"));

        std::cout << "✓ Delete test passed" << std::endl;
    }

    void testDeleteMissingLeavesDirectoryUnchanged() {
        std::cout << "Testing delete of a missing file..." << std::endl;

        TestWorkspace ws("manager_delete_missing");
        ws.write("keep.txt", "keep");

        SafeBackup::BackupManager manager(ws.context());
        assert(expectError([&] { manager.deleteFile("ghost.txt"); }) == SafeBackup::ErrorKind::NOT_FOUND);
        assert(expectError([&] { manager.deleteFile("../keep.txt"); }) == SafeBackup::ErrorKind::INVALID_INPUT);

        assert(ws.fileCount() == 1);
        assert(ws.read("keep.txt") == "keep");

        std::cout << "✓ Delete missing test passed" << std::endl;
    }

    void testDeleteRefusesDirectories() {
        std::cout << "Testing delete of a directory..." << std::endl;

        TestWorkspace ws("manager_delete_dir");
        fs::create_directories(ws.path("folder"));

        SafeBackup::BackupManager manager(ws.context());
        assert(expectError([&] { manager.deleteFile("folder"); }) == SafeBackup::ErrorKind::IO_FAILURE);
        assert(fs::is_directory(ws.path("folder")));

        std::cout << "✓ Delete directory test passed" << std::endl;
    }

    void testActivityLogFailureFailsOperation() {
        std::cout << "Testing activity log failure..." << std::endl;

        TestWorkspace ws("manager_log_failure");
        ws.write("notes.md", "text");
        // A directory where the log file should be makes every append fail
        fs::create_directories(ws.path("logfile.txt"));

        SafeBackup::BackupManager manager(ws.context(10));
        assert(expectError([&] { manager.createBackup("notes.md"); }) == SafeBackup::ErrorKind::IO_FAILURE);

        // The copy itself already happened
        assert(ws.read("notes.md.10.bak") == "text");

        std::cout << "✓ Activity log failure test passed" << std::endl;
    }

    void testListBackups() {
        std::cout << "Testing backup listing through the manager..." << std::endl;

        TestWorkspace ws("manager_list");
        ws.write("a.txt", "a");

        SafeBackup::BackupManager(ws.context(1)).createBackup("a.txt");
        SafeBackup::BackupManager(ws.context(2)).createBackup("a.txt");

        SafeBackup::BackupManager manager(ws.context(3));
        auto entries = manager.listBackups("a.txt");
        assert(entries.size() == 3);
        assert(entries[0].timestamp == 1);
        assert(entries[1].timestamp == 2);
        assert(entries[2].is_plain);

        assert(expectError([&] { manager.listBackups("/etc/passwd"); }) == SafeBackup::ErrorKind::INVALID_INPUT);

        std::cout << "✓ Listing test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running BackupManager unit tests..." << std::endl;

        testBackupCreatesBothArtifacts();
        testSecondBackupOverwritesPlainOnly();
        testBackupOfBakFile();
        testBackupErrors();
        testRoundTripByOriginalName();
        testRestoreFromPlainBackupName();
        testDelete();
        testDeleteMissingLeavesDirectoryUnchanged();
        testDeleteRefusesDirectories();
        testActivityLogFailureFailsOperation();
        testListBackups();

        std::cout << "All BackupManager tests passed!" << std::endl;
    }
};

int main() {
    SafeBackup::Logger::getInstance().setConsoleLogging(false);

    try {
        BackupManagerTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All BackupManager component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
