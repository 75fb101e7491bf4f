#pragma once

#include <exception>
#include <string>

namespace mypv {

class MyPvException : public std::exception {
    public:
        MyPvException() { mWhat = "Unknown error"; }
        MyPvException(const char* what) : mWhat(what) {}
        MyPvException(const std::string& what) : mWhat(what) {}
        virtual const char* what() const throw() { return mWhat.c_str(); }
    protected:
        std::string mWhat;
};

class MyPvProgramException : public MyPvException {
    public:
        MyPvProgramException(const std::string& what) : MyPvException(what) {}
};

/**
    Connection to device cannot be established.
    Fatal until caller retries connect()
*/
class ConnectError : public MyPvException {
    public:
        ConnectError(const std::string& what) : MyPvException(what) {}
};

/**
    Base class for failures of a single read or write request
*/
class RequestError : public MyPvException {
    public:
        typedef enum {
            BUSY,
            TIMEOUT,
            PROTOCOL,
            TRANSPORT
        } Kind;

        RequestError(Kind kind, const std::string& what) : MyPvException(what), mKind(kind) {}

        Kind getKind() const { return mKind; }

        // soft failures can be retried without reconnecting
        bool isSoft() const { return mKind != Kind::TRANSPORT; }
    private:
        Kind mKind;
};

class BusyError : public RequestError {
    public:
        BusyError(const std::string& what) : RequestError(Kind::BUSY, what) {}
};

class TimeoutError : public RequestError {
    public:
        TimeoutError(const std::string& what) : RequestError(Kind::TIMEOUT, what) {}
};

class ProtocolError : public RequestError {
    public:
        // no modbus exception code, response has wrong size or is garbled
        static constexpr int MALFORMED_RESPONSE = 0;

        ProtocolError(int code, const std::string& what)
            : RequestError(Kind::PROTOCOL, what), mCode(code) {}

        int getCode() const { return mCode; }
    private:
        int mCode;
};

class TransportError : public RequestError {
    public:
        TransportError(const std::string& what) : RequestError(Kind::TRANSPORT, what) {}
};

class DecodeError : public MyPvException {
    public:
        DecodeError(const std::string& what) : MyPvException(what) {}
};

class EncodeError : public MyPvException {
    public:
        typedef enum {
            OUT_OF_RANGE,
            UNKNOWN_TAG,
            TYPE_MISMATCH
        } Reason;

        EncodeError(Reason reason, const std::string& what) : MyPvException(what), mReason(reason) {}
        Reason getReason() const { return mReason; }
    private:
        Reason mReason;
};

/**
    Poll cycle failed, no snapshot was produced
*/
class PollError : public MyPvException {
    public:
        typedef enum {
            // soft failures still present after all retries
            SOFT_FAILURE,
            HARD_FAILURE,
            DECODE_FAILURE,
            CANCELLED
        } Cause;

        PollError(Cause cause, int attempts, const std::string& what)
            : MyPvException(what), mCause(cause), mAttempts(attempts) {}

        Cause getCause() const { return mCause; }
        bool isHard() const { return mCause != Cause::SOFT_FAILURE; }
        int getAttempts() const { return mAttempts; }
    private:
        Cause mCause;
        int mAttempts;
};

class UnknownDeviceModel : public MyPvException {
    public:
        UnknownDeviceModel(const std::string& what) : MyPvException(what) {}
};

class RegisterMapException : public MyPvException {
    public:
        RegisterMapException(const std::string& what) : MyPvException(what) {}
};

class FacadeError : public MyPvException {
    public:
        typedef enum {
            NO_SNAPSHOT,
            FIELD_NOT_AVAILABLE
        } Reason;

        FacadeError(Reason reason, const std::string& what) : MyPvException(what), mReason(reason) {}
        Reason getReason() const { return mReason; }
    private:
        Reason mReason;
};

}
