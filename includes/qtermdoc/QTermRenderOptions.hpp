/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#pragma once

#include <QtCore/QObject>

class QTermRenderOptions {
    public:
        enum ColorMode {
            Color,
            Grayscale
        };

        QTermRenderOptions() : data( 0 ) {
        }

        ColorMode colorMode() const {
            return static_cast<ColorMode>(bits.colorMode);
        }

        void setColorMode( ColorMode _colorMode ) {
            bits.colorMode = _colorMode;
        }

    private:
        friend inline bool operator==( QTermRenderOptions lhs, QTermRenderOptions rhs );
        friend inline uint qHash( QTermRenderOptions opts, uint seed );

        struct Bits {
            quint32 colorMode : 2;
            quint32 reserved  : 30;
            quint32 reserved2 : 32;
        };

        union {
            Bits    bits;
            quint64 data;
        };
};

inline bool operator==( QTermRenderOptions lhs, QTermRenderOptions rhs ) {
    return lhs.data == rhs.data;
}


inline bool operator!=( QTermRenderOptions lhs, QTermRenderOptions rhs ) {
    return !operator==( lhs, rhs );
}


inline uint qHash( QTermRenderOptions opts, uint seed = 0 ) {
    return ::qHash( opts.data, seed );
}


Q_DECLARE_METATYPE( QTermRenderOptions );
