/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The seekbuf project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <iostream>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include "../src/seekbuf.h"
#include "../src/util/logmanager.h"

using namespace seekbuf;
using namespace std;

static string readFile(const string& path) {
    ifstream in(path, ios::binary);
    return string((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());
}

static void put(SeekableBuffer& b, const string& s) {
    b.write(s.data(), s.size());
}

static string str(const vector<uint8_t>& v) {
    return string(v.begin(), v.end());
}

static void discard(const string& path) {
    if (remove(path.c_str()) != 0) {
        warning() << "could not remove " << path << ": " << errnoWithDescription();
    }
}

static int run(int argc, char** argv) {
    initLoggingFromEnv();

    // optional: route decorator logs to a file
    unique_ptr<LogManager> logs;
    if (argc > 1) {
        logs = make_unique<LogManager>(argv[1]);
    }

    cout << "=== seekbuf decorator stacks ===\n\n";

    // Transaction -> FileSync -> Logging -> Buffer
    {
        const string file = "seekbuf_tx_outside.dat";
        auto logged = make_unique<LoggingDecorator>(make_unique<SeekBuffer>(), "Core");
        auto synced = make_unique<FileSyncDecorator>(std::move(logged));
        FileSyncDecorator* sync = synced.get();
        sync->enable_sync(file);
        TransactionDecorator tx(std::move(synced));

        tx.begin();
        put(tx, "Committed data");
        cout << "before commit, file: '" << readFile(file) << "'\n";
        tx.commit();
        cout << "after commit,  file: '" << readFile(file) << "'\n";

        tx.begin();
        put(tx, " + rolled back");
        tx.rollback();
        cout << "after rollback, file: '" << readFile(file) << "'\n\n";

        sync->close();
        discard(file);
    }

    // FileSync -> Transaction -> Buffer
    {
        const string file = "seekbuf_sync_outside.dat";
        auto txp = make_unique<TransactionDecorator>(make_unique<SeekBuffer>(string("Balance: $1000")));
        TransactionDecorator* tx = txp.get();
        FileSyncDecorator sync(std::move(txp));
        sync.enable_sync(file);

        tx->begin();
        put(sync, " -> $1500");
        cout << "inside transaction, file: '" << readFile(file) << "'\n";
        tx->rollback();
        sync.sync();
        cout << "after rollback + sync, file: '" << readFile(file) << "'\n";
        cout << "buffer: '" << str(sync.bytes()) << "'\n";

        sync.close();
        discard(file);
    }

    cout << "\n=== done ===\n";
    return 0;
}

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const IoError& e) {
        cerr << "I/O failure: " << e.what() << endl;
    } catch (const std::exception& e) {
        cerr << "error: " << e.what() << endl;
    }
    return 1;
}
