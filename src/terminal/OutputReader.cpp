#include "OutputReader.hpp"

#include "LogHandler.hpp"
#include "RawFdUtils.hpp"

namespace agt {
OutputReader::OutputReader(shared_ptr<TerminalSession> _session)
    : session(_session), cancelled(false), finished(false) {}

OutputReader::~OutputReader() { cancel(); }

void OutputReader::start() {
  lock_guard<mutex> guard(threadMutex);
  if (readerThread || cancelled) {
    return;
  }
  readerThread.reset(new thread(&OutputReader::run, this));
}

void OutputReader::cancel() {
  cancelled = true;
  lock_guard<mutex> guard(threadMutex);
  if (readerThread && readerThread->joinable()) {
    if (readerThread->get_id() == std::this_thread::get_id()) {
      STFATAL << "Output reader tried to cancel itself";
    }
    readerThread->join();
  }
}

void OutputReader::run() {
  LogHandler::setThreadName("reader-" + session->getId());
  session->markRunning();
  auto terminal = session->getTerminal();
  auto connection = session->getConnection();
  int fd = terminal->getFd();
  VLOG(1) << "Output reader started for " << session->getId() << " on fd "
          << fd;

  try {
    while (!cancelled && session->isRunning()) {
      // A slow client leaves the bytes in the pty so the child blocks
      if (connection &&
          !connection->waitForCapacity(READER_POLL_TIMEOUT_MS)) {
        continue;
      }
      if (RawFdUtils::waitForReadable(fd, READER_POLL_TIMEOUT_MS)) {
        if (!readChunk(fd)) {
          break;
        }
        continue;
      }
      if (cancelled) {
        break;
      }
      if (terminal->hasExited()) {
        LOG(INFO) << "Terminal process for " << session->getId() << " exited";
        // Drain whatever the child wrote before exiting
        while (!cancelled && RawFdUtils::waitForReadable(fd, 0) &&
               readChunk(fd)) {
        }
        break;
      }
      sleepMs(READER_IDLE_SLEEP_MS);
    }
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Error in terminal output reader for " << session->getId()
               << ": " << ex.what();
    session->sendToClient(ServerMessage::error(ex.what()));
  }

  string tail = decoder.flush();
  if (!tail.empty()) {
    session->sendToClient(ServerMessage::output(tail));
  }
  session->markEnding();
  json ended = ServerMessage::status("ended");
  ended["running"] = false;
  ended["message"] = "Session ended";
  session->sendToClient(ended);
  finished = true;
  VLOG(1) << "Output reader finished for " << session->getId();
}

bool OutputReader::readChunk(int fd) {
  char b[READER_CHUNK_SIZE];
  ssize_t rc = ::read(fd, b, READER_CHUNK_SIZE);
  if (rc > 0) {
    string text = decoder.decode(b, rc);
    if (!text.empty() && !session->sendToClient(ServerMessage::output(text))) {
      LOG(INFO) << "Client for " << session->getId()
                << " is gone, stopping output reader";
      return false;
    }
    return true;
  }
  if (rc == 0) {
    LOG(INFO) << "Terminal session " << session->getId() << " ended (EOF)";
    return false;
  }
  int readErrno = errno;
  if (readErrno == EAGAIN || readErrno == EWOULDBLOCK ||
      readErrno == EINTR) {
    return true;
  }
  if (readErrno == EIO) {
    // Linux reports a hung-up slave as EIO: the child has gone away
    LOG(INFO) << "Terminal session " << session->getId() << " ended (EIO)";
    return false;
  }
  LOG(ERROR) << "Terminal read error for " << session->getId() << ": "
             << strerror(readErrno);
  return false;
}
}  // namespace agt
