#include "Application.h"
#include <iostream>

Application::Application(const sRelaySettings& settings) :
        settings(settings),
        broker(createBroker(settings)),
        httpServer(std::make_unique<HttpServer>(broker, settings)),
        websocketServer(std::make_unique<WebSocketServer>(broker, settings)) {}

void Application::start() {
    std::cout << "Relay: Chunk size " << formatSize(settings.chunkSize)
              << ", channel capacity " << formatSize(settings.channelCapacity) << std::endl;

    // Start the websocket server
    websocketServer->start();

    // Now finally start the http server to handle downloads and uploads
    httpServer->start();

    pruneThread = std::jthread([this] {
        this->runPruneLoop();
    });
}

void Application::join() {
    httpServer->join();
}

void Application::stop() {
    interruptablePruneTimer.stop();
    if (pruneThread.joinable()) {
        pruneThread.join();
    }

    httpServer->stop();
    websocketServer->stop();
}

void Application::runPruneLoop() {
    // Returns false once the timer is stopped
    while (interruptablePruneTimer.wait_for(settings.pruneInterval)) {
        try {
            pruneExpiredTransfers();
        } catch (std::exception& exception) {
            // The next sweep tries again
            dumpExceptions(exception);
        }
    }
}

void Application::pruneExpiredTransfers() {
    for (const auto& record : broker->metadataStore->pruneExpired()) {
        // Same order as a session's own cleanup, the transfer id is released last
        broker->chunkChannel->remove(record.channelKey());
        broker->readinessChannel->close(record.transferId, record.generation);

        std::cout << "Transfer " << record.transferId << ": Expired before a receiver connected" << std::endl;
    }
}
