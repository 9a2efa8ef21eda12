#include <drogon/drogon.h>
#include <iostream>
#include <syslog.h>
#include <signal.h>
#include <stdlib.h>

#include "ChapterIndexer.h"
#include "Config.h"
#include "Database.h"
#include "TextStore.h"
#include "dh_root.h"
#include "dh_login.h"
#include "dh_userInfo.h"
#include "dh_upload.h"
#include "dh_books.h"
#include "dh_book.h"
#include "dh_content.h"
#include "dh_jumpToChapter.h"
#include "dh_heartbeat.h"
#include "utils.h"

void handleSignal(int sig) {
    syslog(SYSLOG_ERR, "txtreaderd terminated by signal %d", sig);
    closelog();
    exit(1);
}

int main() {

    // open syslog
    openlog("txtreaderd", LOG_PID | LOG_CONS, LOG_DAEMON);

    // catch signals
    signal(SIGINT,  handleSignal);
    signal(SIGTERM, handleSignal);
    signal(SIGSEGV, handleSignal); // crash (segfault)

    try {
        ////////////////////////////////////////////////////////////////////////
        // configure the daemon
        //
        Config::get().load(); // load singleton Config

        std::string msg = "txtreaderd " + Config::get().toString() + " starting";
        std::cout << msg << std::endl;
        syslog(SYSLOG_INFO, "%s", msg.c_str());

        ////////////////////////////////////////////////////////////////////////
        // open the sqlite db and the on-disk text library
        //
        Database::get().open(Config::get().dbPath());
        TextStore store(Config::get().libraryDir());
        ChapterIndexer indexer;     // default chapter rules

        ////////////////////////////////////////////////////////////////////////
        // start the server (app) and wait for http events/requests to roll in
        //   "/api/books/public" and "/api/books/random_public" go in before "/api/books/{id}"
        //
        registerRootHandler();
        registerLoginHandler();
        registerUserInfoHandler();
        registerBookListHandlers();
        registerUploadHandler(store, indexer);
        registerBookHandler(store);
        registerContentHandler(store);
        registerJumpToChapterHandler();
        registerHeartbeatHandler();
        std::cout << "Running..." << std::endl;

        drogon::app()
            .setClientMaxBodySize(Config::get().maxFileSize() + 64 * 1024) // file plus multipart framing
            .setClientMaxMemoryBodySize(2 * 1024 * 1024)                   // keep 2 MB in RAM, then packetize
            .setUploadPath(Config::get().uploadDir());                     // temp dir for large files

        drogon::app()
            .addListener(Config::get().host(), Config::get().port())
            .run();

    } catch (const std::exception &ex) {
        logFatal(ex,1);
    }

    syslog(SYSLOG_INFO, "txtreaderd shutting down");
    Database::get().close();
    closelog();
    return 0;
}
