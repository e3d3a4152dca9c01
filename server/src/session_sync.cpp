#include "mirrorsync/server/session.hpp"

#include <spdlog/spdlog.h>

#include "mirrorsync/framing.hpp"

namespace mirrorsync::server
{

    // Server: do you have this file?
    //   bool true, path, hash
    // Client: int32 YES | NO
    //   NO  -> int64 size, then the file bytes
    //   YES -> next entry
    // Terminated by bool false.
    void Session::handle_sync_files()
    {
        if (context_.catalog.empty())
        {
            logger_->debug("No files on the server");
        }

        for (const auto &entry : context_.catalog)
        {
            if (entry.path.size() > protocol::kMaxUtfLength || entry.hash.size() > protocol::kMaxUtfLength)
            {
                logger_->error("Catalog entry {:.64}... is too long to send, killing sync process", entry.path);
                break;
            }
            try
            {
                logger_->debug("Asking client if they have file: {}", entry.path);
                stream_.write_bool(true);
                stream_.write_utf(entry.path);
                stream_.write_utf(entry.hash);
                stream_.flush();

                const auto answer = protocol::binary_answer_from_int(stream_.read_int32());
                logger_->debug("Client answered {} for {}", protocol::to_string(answer), entry.path);
                if (answer == protocol::BinaryAnswer::No)
                {
                    timeout_.set(context_.transfer_timeout);
                    transfer_file(entry.path);
                }
                else
                {
                    timeout_.set(context_.idle_timeout);
                }
            }
            catch (const TransportError &ex)
            {
                logger_->debug("{}", ex.what());
                logger_->info("Encountered error during sync with {}, killing sync process", endpoint_);
                break;
            }
        }

        logger_->debug("Finished sync");
        stream_.write_bool(false);
        stream_.flush();
    }

} // namespace mirrorsync::server
