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

#include <qtermdoc/QTermSink.hpp>

/* U+2580 UPPER HALF BLOCK */
static const QChar UpperHalf( 0x2580 );

QTermBlockSink::QTermBlockSink( QIODevice *out ) : QTermSink( CellFallback, out ) {
}


QTermBlockSink::~QTermBlockSink() {
}


void QTermBlockSink::emitImage( const QImage& buffer, const QTermPlacement& placement ) {
    clear();

    if ( buffer.isNull() or placement.targetCells.isEmpty() ) {
        return;
    }

    const QStringList rows = halfBlocks( buffer, placement.targetCells.size() );

    QByteArray out;

    for ( int r = 0; r < rows.count(); r++ ) {
        out += moveTo( placement.targetCells.x(), placement.targetCells.y() + r );
        out += rows.at( r ).toUtf8();
    }

    write( out );
    flush();

    mLastCells = placement.targetCells;
}


void QTermBlockSink::clear() {
    if ( mLastCells.isEmpty() ) {
        return;
    }

    QByteArray       out( "\x1b[0m" );
    const QByteArray blank( mLastCells.width(), ' ' );

    for ( int r = 0; r < mLastCells.height(); r++ ) {
        out += moveTo( mLastCells.x(), mLastCells.y() + r );
        out += blank;
    }

    write( out );
    flush();

    mLastCells = QRect();
}


QStringList QTermBlockSink::halfBlocks( const QImage& buffer, QSize cells ) {
    QStringList rows;

    if ( buffer.isNull() or cells.isEmpty() ) {
        return rows;
    }

    /** Two vertical samples per cell */
    QImage samples = buffer.convertToFormat( QImage::Format_RGB32 );

    if ( samples.size() != QSize( cells.width(), cells.height() * 2 ) ) {
        samples = samples.scaled( cells.width(), cells.height() * 2, Qt::IgnoreAspectRatio, Qt::SmoothTransformation );
    }

    for ( int r = 0; r < cells.height(); r++ ) {
        QString row;
        QRgb    lastFg = 0;
        QRgb    lastBg = 0;
        bool    first  = true;

        for ( int c = 0; c < cells.width(); c++ ) {
            const QRgb fg = samples.pixel( c, 2 * r ) & RGB_MASK;
            const QRgb bg = samples.pixel( c, 2 * r + 1 ) & RGB_MASK;

            /** Only change colours when they change */
            if ( first or (fg != lastFg) or (bg != lastBg) ) {
                row += QString( "\x1b[38;2;%1;%2;%3;48;2;%4;%5;%6m" )
                          .arg( qRed( fg ) ).arg( qGreen( fg ) ).arg( qBlue( fg ) )
                          .arg( qRed( bg ) ).arg( qGreen( bg ) ).arg( qBlue( bg ) );

                lastFg = fg;
                lastBg = bg;
                first  = false;
            }

            row += UpperHalf;
        }

        row += "\x1b[0m";
        rows << row;
    }

    return rows;
}
