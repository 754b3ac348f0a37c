#pragma once
#include <stddef.h>
#include <stdint.h>

#include <string>

/*
===============================================================================
  SerialPort.h
===============================================================================

  PURPOSE
  -------
  Byte-stream interface SerialLink runs on. Plays the role Arduino's Stream
  plays on the rig side: AsioSerialPort drives a real tty, tests drive a
  scripted fake.

  Errors are reported as false / -1 with the reason in lastError(). No call
  throws.
===============================================================================
*/

class SerialPort {
public:
  virtual ~SerialPort() {}

  virtual bool open(const std::string& device, uint32_t baud) = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;

  // Bytes waiting to be read without blocking; -1 on I/O error.
  virtual int available() = 0;

  // Reads up to len bytes. Only call after available() > 0; -1 on I/O error.
  virtual int read(char* buf, size_t len) = 0;

  virtual bool write(const char* data, size_t len) = 0;

  // Drops anything pending in the input and output buffers.
  virtual bool discardBuffers() = 0;

  virtual const std::string& lastError() const = 0;
};
