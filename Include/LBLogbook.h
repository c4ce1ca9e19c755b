/// @file       LBLogbook.h
/// @brief      The logbook: completed flights appended to a CSV file
/// @author     Logbook authors
/// @copyright  (c) 2024 Logbook authors
/// @copyright  Permission is hereby granted, free of charge, to any person obtaining a
///             copy of this software and associated documentation files (the "Software"),
///             to deal in the Software without restriction, including without limitation
///             the rights to use, copy, modify, merge, publish, distribute, sublicense,
///             and/or sell copies of the Software, and to permit persons to whom the
///             Software is furnished to do so, subject to the following conditions:\n
///             The above copyright notice and this permission notice shall be included in
///             all copies or substantial portions of the Software.\n
///             THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
///             IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
///             FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
///             AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
///             LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
///             OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
///             THE SOFTWARE.

#ifndef LBLogbook_h
#define LBLogbook_h

/// CSV file, to which completed flights are appended
class Logbook
{
protected:
    std::string     path;       ///< file path
    std::ofstream   f;          ///< the open file

public:
    /// @brief Opens the file for appending, writes the header if the file is new
    /// @exception LBError if the file cannot be opened or written
    explicit Logbook (const std::string& _path);
    
    /// @brief Appends the flight's record
    /// @exception LBError if writing fails
    void Log (const FlightTy& flight);
    
    const std::string& GetPath () const { return path; }
    
    /// Quotes a CSV field if it contains a separator, quote, or line break
    static std::string CsvField (const std::string& s);
    /// Joins fields to one CSV line (without line end)
    static std::string CsvLine (const std::vector<std::string>& fields);
    
protected:
    /// writes one line and flushes
    void WriteLine (const std::vector<std::string>& fields);
};

#endif /* LBLogbook_h */
