#ifndef CREDSWEEP_CHECKPOINT_HPP
#define CREDSWEEP_CHECKPOINT_HPP

#include "TrialPair.hpp"
#include "types.hpp"

#include <mutex>
#include <string>

/// \file Checkpoint.hpp

/// Last pair submitted for trial, as saved on disk
struct Checkpoint
{
    std::string lastIdentity; ///< Identity of the last pair, empty if none
    std::string lastSecret;   ///< Secret of the last pair, empty if none
};

/// \brief Persistent storage for a single checkpoint record
///
/// Every call to save() overwrites the record. Workers save their own pair
/// concurrently, so the stored record is the one written last and not
/// necessarily the latest pair in dispatch order.
///
/// The file holds two lines, "identity <hex>" and "secret <hex>".
class CheckpointStore
{
public:
    /// Exception thrown if a checkpoint file is malformed
    class Error : public BaseError
    {
    public:
        /// Constructor
        Error(const std::string& description);
    };

    /// Constructor. No file is touched until save() or load() is called.
    explicit CheckpointStore(std::string filename);

    /// \brief Overwrite the stored record with the given pair
    /// \exception FileError if the record cannot be written
    void save(const TrialPair& pair);

    /// \brief Read the stored record
    /// \return the stored record, or an empty one if there is no checkpoint file
    /// \exception Error if the file is malformed
    /// \exception FileError if the file cannot be accessed
    auto load() const -> Checkpoint;

    /// \return true if a checkpoint file exists
    /// \exception FileError if it cannot be determined
    auto exists() const -> bool;

private:
    const std::string  m_filename;
    mutable std::mutex m_mutex;
};

#endif // CREDSWEEP_CHECKPOINT_HPP
